/**
 * @file customadapter.cpp
 * @date October 2026
 * @brief Пользовательские адаптеры из ключей lfs.customtransfer.*
 */

#include "lfs/customadapter.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <utility>

#include "lfs/compositelogger.hpp"
#include "lfs/manifest.hpp"

namespace lfs {

CustomAdapter::CustomAdapter(const std::string& name, Direction dir,
                             std::string path, std::string args,
                             bool concurrent)
    : AdapterBase(name, dir),
      path_(std::move(path)),
      args_(std::move(args)),
      concurrent_(concurrent) {}

std::string CustomAdapter::command() const {
  if (args_.empty()) {
    return path_;
  }
  return path_ + " " + args_;
}

int CustomAdapter::effectiveConcurrency(const AdapterConfig& config) const {
  if (!concurrent_) {
    return 1;
  }
  return AdapterBase::effectiveConcurrency(config);
}

void configureCustomAdapters(const Environment& env, Manifest& manifest) {
  static const std::regex pathKey(R"(lfs\.customtransfer\.([^.]+)\.path)");

  for (const auto& [key, path] : env.all()) {
    std::smatch match;
    if (!std::regex_match(key, match, pathKey)) {
      continue;
    }

    const std::string name = match[1].str();
    const std::string prefix = "lfs.customtransfer." + name;

    if (path.empty()) {
      CompositeLogger::instance().warning("Custom transfer adapter \"" + name +
                                          "\" has an empty path, skipping");
      continue;
    }

    std::string args = env.get(prefix + ".args").value_or("");
    bool concurrent = env.getBool(prefix + ".concurrent", true);
    std::string direction = env.get(prefix + ".direction").value_or("");
    if (direction.empty()) {
      direction = "both";
    } else {
      std::transform(direction.begin(), direction.end(), direction.begin(),
                     [](unsigned char c) { return std::tolower(c); });
    }

    const bool download = direction == "download" || direction == "both";
    const bool upload = direction == "upload" || direction == "both";
    if (!download && !upload) {
      CompositeLogger::instance().warning(
          "Custom transfer adapter \"" + name + "\" has invalid direction \"" +
          direction + "\", skipping");
      continue;
    }

    AdapterFactory factory =
        [path = path, args, concurrent](
            const std::string& adapterName,
            Direction dir) -> std::unique_ptr<TransferAdapter> {
      return std::make_unique<CustomAdapter>(adapterName, dir, path, args,
                                             concurrent);
    };

    if (download) {
      manifest.registerNewAdapterFunc(name, Direction::Download, factory);
    }
    if (upload) {
      manifest.registerNewAdapterFunc(name, Direction::Upload, factory);
    }

    CompositeLogger::instance().debug("Configured custom transfer adapter \"" +
                                      name + "\" (" + direction + "): " +
                                      path);
  }
}

}  // namespace lfs
