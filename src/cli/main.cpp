#include <cstdlib>
#include <iterator>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/DeploymentRequest.hpp"
#include "core/ParameterBinder.hpp"
#include "core/TemplateBinder.hpp"
#include "core/TemplateParser.hpp"

// template-binder: validate a template or bind parameters to it from the command line.
//
// Exit codes: 0 success, 1 template or binding error, 2 usage error.

namespace {

constexpr int kExitBindingError = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
  std::string sCommand;
  std::string sTemplatePath;
  std::optional<std::string> osParametersPath;
  std::vector<std::pair<std::string, std::string>> vParamOverrides;
  std::optional<std::string> osResourceGroup;
  std::optional<std::string> osLocation;
  std::optional<std::string> osSubscription;
};

void printUsage(std::ostream& os) {
  os << "usage: template-binder validate <template.json>\n"
        "       template-binder bind <template.json> [parameters.json]\n"
        "                            [--param name=value]... [--resource-group rg]\n"
        "                            [--location loc] [--subscription id]\n";
}

CliArgs parseArgs(int argc, char** argv) {
  if (argc < 3) {
    throw tpl::common::ValidationError("usage", "Missing command or template path");
  }
  CliArgs args;
  args.sCommand = argv[1];
  if (args.sCommand != "validate" && args.sCommand != "bind") {
    throw tpl::common::ValidationError("usage", "Unknown command '" + args.sCommand + "'");
  }
  args.sTemplatePath = argv[2];

  auto requireValue = [&](int& i) -> std::string {
    if (i + 1 >= argc) {
      throw tpl::common::ValidationError("usage", std::string("Option ") + argv[i] +
                                                      " requires a value");
    }
    return argv[++i];
  };

  for (int i = 3; i < argc; ++i) {
    const std::string sArg = argv[i];
    if (args.sCommand == "validate") {
      throw tpl::common::ValidationError("usage", "validate takes no options ('" + sArg + "')");
    }
    if (sArg == "--param") {
      const std::string sPair = requireValue(i);
      const auto nEq = sPair.find('=');
      if (nEq == std::string::npos || nEq == 0) {
        throw tpl::common::ValidationError("usage", "--param expects name=value, got '" +
                                                        sPair + "'");
      }
      args.vParamOverrides.emplace_back(sPair.substr(0, nEq), sPair.substr(nEq + 1));
    } else if (sArg == "--resource-group") {
      args.osResourceGroup = requireValue(i);
    } else if (sArg == "--location") {
      args.osLocation = requireValue(i);
    } else if (sArg == "--subscription") {
      args.osSubscription = requireValue(i);
    } else if (sArg.rfind("--", 0) == 0) {
      throw tpl::common::ValidationError("usage", "Unknown option '" + sArg + "'");
    } else if (!args.osParametersPath.has_value()) {
      args.osParametersPath = sArg;
    } else {
      throw tpl::common::ValidationError("usage", "Unexpected argument '" + sArg + "'");
    }
  }
  return args;
}

int runValidate(const tpl::core::TemplateParser& tpParser,
                const tpl::core::TemplateBinder& tbBinder, const CliArgs& args) {
  auto tmpl = tpParser.parseFile(args.sTemplatePath);
  tbBinder.validate(tmpl);

  nlohmann::json jParams = nlohmann::json::array();
  for (const auto& pd : tmpl.vParameters) {
    jParams.push_back({{"name", pd.sName},
                       {"type", tpl::common::toString(pd.type)},
                       {"required", pd.isRequired()}});
  }
  nlohmann::json jOut = {{"valid", true},
                         {"contentVersion", tmpl.sContentVersion},
                         {"parameters", std::move(jParams)},
                         {"resourceCount", tmpl.vResources.size()}};
  std::cout << jOut.dump(2) << "\n";
  return EXIT_SUCCESS;
}

int runBind(const tpl::core::TemplateParser& tpParser, const tpl::core::TemplateBinder& tbBinder,
            const CliArgs& args) {
  auto tmpl = tpParser.parseFile(args.sTemplatePath);

  nlohmann::json jValues = nlohmann::json::object();
  if (args.osParametersPath.has_value()) {
    jValues = tpParser.parseParameterValuesFile(*args.osParametersPath);
  }
  for (const auto& [sName, sText] : args.vParamOverrides) {
    const auto* pDecl = tmpl.findParameter(sName);
    // --param replaces a file value spelled with different case
    for (auto it = jValues.begin(); it != jValues.end();) {
      it = tpl::common::toLowerAscii(it.key()) == tpl::common::toLowerAscii(sName)
               ? jValues.erase(it)
               : std::next(it);
    }
    jValues[pDecl != nullptr ? pDecl->sName : sName] =
        pDecl != nullptr ? tpl::core::ParameterBinder::coerceFromText(*pDecl, sText)
                         : nlohmann::json(sText);
  }

  auto rt = tbBinder.bind(tmpl, jValues);

  nlohmann::json jOut = {
      {"deployment", tpl::core::DeploymentRequest::build(rt, tbBinder.options().dcContext)},
      {"parameters", tpl::core::DeploymentRequest::redactParameters(rt)},
      {"outputs", rt.mOutputs},
      {"deferred", rt.vDeferredLocations},
  };
  std::cout << jOut.dump(2) << "\n";
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  tpl::common::Config cfgApp;
  try {
    cfgApp = tpl::common::Config::load();
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] configuration error: " << ex.what() << "\n";
    return kExitUsage;
  }
  tpl::common::Logger::init(cfgApp.sLogLevel);
  auto spLog = tpl::common::Logger::get();

  CliArgs args;
  try {
    args = parseArgs(argc, argv);
  } catch (const tpl::common::ValidationError& e) {
    std::cerr << "template-binder: " << e.what() << "\n";
    printUsage(std::cerr);
    return kExitUsage;
  }

  auto boOptions = tpl::core::BindOptions::fromConfig(cfgApp);
  if (args.osResourceGroup) boOptions.dcContext.sResourceGroup = *args.osResourceGroup;
  if (args.osLocation) boOptions.dcContext.sLocation = *args.osLocation;
  if (args.osSubscription) boOptions.dcContext.sSubscriptionId = *args.osSubscription;

  tpl::core::TemplateParser tpParser(static_cast<size_t>(cfgApp.iMaxTemplateBytes));
  tpl::core::TemplateBinder tbBinder(std::move(boOptions));

  try {
    if (args.sCommand == "validate") {
      return runValidate(tpParser, tbBinder, args);
    }
    return runBind(tpParser, tbBinder, args);
  } catch (const tpl::common::BindingError& e) {
    spLog->error("{} ({}): {}", e._sErrorCode, e._sName, e.what());
    nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}, {"name", e._sName}};
    std::cout << jErr.dump(2) << "\n";
    return kExitBindingError;
  } catch (const tpl::common::AppError& e) {
    spLog->error("{}: {}", e._sErrorCode, e.what());
    return kExitBindingError;
  } catch (const std::exception& ex) {
    spLog->error("Unexpected error: {}", ex.what());
    nlohmann::json jErr = {{"error", "internal_error"}, {"message", ex.what()}};
    std::cout << jErr.dump(2) << "\n";
    return kExitBindingError;
  }
}
