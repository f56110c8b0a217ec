#include "orrery/core/cvar.hpp"
#include "orrery/core/logger.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace orrery::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

void CVarSystem::registerCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
        Logger::warn("CVar '{}' registered twice, keeping the first", cvar->name);
        return;
    }
    map[cvar->name] = cvar;
}

ICVar* CVarSystem::find(const std::string& name) {
    auto& map = getCVarMap();
    auto it = map.find(name);
    if (it != map.end()) {
        return it->second;
    }
    return nullptr;
}

std::unordered_map<std::string, ICVar*>& CVarSystem::getAll() {
    return getCVarMap();
}

int CVarSystem::saveToIni(const std::filesystem::path& path) {
    auto& map = getCVarMap();

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Logger::info("Saving CVars to: {}", std::filesystem::absolute(path).string());
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        Logger::error("Failed to open CVar file for writing: {}", path.string());
        return 0;
    }

    int savedCount = 0;
    for (auto const& [name, cvar] : map) {
        if (cvar->flags & CVarFlags::save) {
            f << "; " << cvar->description << "\n";
            f << name << "=" << cvar->toString() << "\n";
            savedCount++;
        }
    }
    Logger::info("Successfully saved {} CVars", savedCount);
    return savedCount;
}

int CVarSystem::loadFromIni(const std::filesystem::path& path) {
    Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());
    std::ifstream f(path);
    if (!f) {
        Logger::warn("CVar file not found: {}", path.string());
        return 0;
    }

    int loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string name = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        ICVar* cvar = find(name);
        if (cvar == nullptr) {
            Logger::debug("Ignoring unknown CVar '{}'", name);
            continue;
        }
        if (cvar->flags & CVarFlags::read_only) {
            Logger::warn("CVar '{}' is read-only, ignoring value '{}'", name, val);
            continue;
        }
        try {
            cvar->setFromString(val);
            loadedCount++;
        } catch (const std::invalid_argument& e) {
            Logger::warn("Failed to set CVar {} from string value '{}': {}", name, val, e.what());
        } catch (const std::out_of_range& e) {
            Logger::warn("CVar {} value '{}' is out of range: {}", name, val, e.what());
        }
    }
    Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

CVar<std::string>::CVar(const char *name, const char *desc,
                        std::string defaultValue, CVarFlags flags,
                        OnChangeFunc onChange)
    : m_value(defaultValue),
      m_default(std::move(defaultValue)),
      m_onChange(std::move(onChange)) {
    this->name = name;
    this->description = desc;
    this->flags = flags;

    CVarSystem::registerCVar(this);
}

std::string CVar<std::string>::get() const {
    return m_value;
}

void CVar<std::string>::set(std::string val) {
    m_value = std::move(val);
    if (m_onChange) {
        m_onChange(m_value);
    }
}

void CVar<std::string>::reset() {
    set(m_default);
}

std::string CVar<std::string>::toString() const {
    return m_value;
}

void CVar<std::string>::setFromString(const std::string& val) {
    set(val);
}

}
