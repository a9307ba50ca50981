/**
 * @file attribute.cpp
 * @date October 2026
 * @brief Установка и удаление секции filter.lfs
 */

#include "lfs/attribute.hpp"

#include <algorithm>

#include "lfs/compositelogger.hpp"
#include "lfs/selfpath.hpp"

namespace lfs {

namespace {

const char* const kFilterSection = "filter.lfs";

GitConfiguration& requireGitConfig(const FilterOptions& options) {
  if (options.gitConfig == nullptr) {
    throw std::invalid_argument("FilterOptions: gitConfig is not set");
  }
  return *options.gitConfig;
}

bool shouldReset(const std::string& current,
                 const std::vector<std::string>& upgradeables) {
  if (current.empty()) {
    return true;
  }
  return std::find(upgradeables.begin(), upgradeables.end(), current) !=
         upgradeables.end();
}

}  // namespace

AttributeConflictError::AttributeConflictError(const std::string& key,
                                               const std::string& expected,
                                               const std::string& actual)
    : std::runtime_error("the \"" + key + "\" attribute should be \"" +
                         expected + "\" but is \"" + actual + "\""),
      key_(key),
      expected_(expected),
      actual_(actual) {}

ConfigScope FilterOptions::scope() const {
  if (local) return ConfigScope::Local;
  if (worktree) return ConfigScope::Worktree;
  if (system) return ConfigScope::System;
  return ConfigScope::Global;
}

void FilterOptions::install() const {
  if (skipSmudge) {
    skipSmudgeFilterAttribute().install(*this);
  } else {
    filterAttribute().install(*this);
  }
}

void FilterOptions::uninstall() const { filterAttribute().uninstall(*this); }

std::string Attribute::normalizeKey(const std::string& property) const {
  return section + "." + property;
}

void Attribute::install(const FilterOptions& options) const {
  GitConfiguration& git = requireGitConfig(options);
  const ConfigScope scope = options.scope();
  static const std::vector<std::string> noUpgradeables;

  for (const auto& [property, value] : properties) {
    auto it = upgradeables.find(property);
    const std::vector<std::string>& legacy =
        it != upgradeables.end() ? it->second : noUpgradeables;

    const std::string key = normalizeKey(property);
    const std::string current = git.find(scope, key);

    if (options.force || shouldReset(current, legacy)) {
      git.set(scope, key, value);
    } else if (current != value) {
      throw AttributeConflictError(key, value, current);
    }
  }

  CompositeLogger::instance().debug("Installed " + section + " in " +
                                    scopeFlag(scope) + " config");
}

void Attribute::uninstall(const FilterOptions& options) const {
  GitConfiguration& git = requireGitConfig(options);
  git.unsetSection(options.scope(), section);
  CompositeLogger::instance().debug("Removed " + section + " from " +
                                    scopeFlag(options.scope()) + " config");
}

Attribute filterAttribute(const std::string& executable) {
  Attribute attr;
  attr.section = kFilterSection;
  attr.properties = {
      {"clean", executable + " clean -- %f"},
      {"smudge", executable + " smudge -- %f"},
      {"process", executable + " filter-process"},
      {"required", "true"},
  };
  attr.upgradeables = {
      {"clean", {executable + " clean %f"}},
      {"smudge",
       {executable + " smudge %f", executable + " smudge --skip %f",
        executable + " smudge --skip -- %f"}},
      {"process",
       {executable + " filter", executable + " filter --skip",
        executable + " filter-process --skip"}},
  };
  return attr;
}

Attribute filterAttribute() { return filterAttribute(selfPath()); }

Attribute skipSmudgeFilterAttribute(const std::string& executable) {
  Attribute attr;
  attr.section = kFilterSection;
  attr.properties = {
      {"clean", executable + " clean -- %f"},
      {"smudge", executable + " smudge --skip -- %f"},
      {"process", executable + " filter-process --skip"},
      {"required", "true"},
  };
  attr.upgradeables = {
      {"clean", {executable + " clean -- %f"}},
      {"smudge",
       {executable + " smudge %f", executable + " smudge --skip %f",
        executable + " smudge -- %f"}},
      {"process",
       {executable + " filter", executable + " filter --skip",
        executable + " filter-process"}},
  };
  return attr;
}

Attribute skipSmudgeFilterAttribute() {
  return skipSmudgeFilterAttribute(selfPath());
}

}  // namespace lfs
