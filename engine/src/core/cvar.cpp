#include "prism/core/cvar.hpp"
#include "prism/core/logger.hpp"
#include <fstream>
#include <unordered_map>
#include <utility>

namespace prism::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

void CVarSystem::registerCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
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

bool CVarSystem::applyAssignment(std::string_view assignment) {
    const size_t eq = assignment.find('=');
    if (eq == std::string_view::npos) {
        core::Logger::warn("Malformed CVar assignment '{}', expected name=value", assignment);
        return false;
    }

    const std::string name(assignment.substr(0, eq));
    const std::string val(assignment.substr(eq + 1));

    ICVar* cvar = find(name);
    if (cvar == nullptr) {
        core::Logger::warn("Unknown CVar: {}", name);
        return false;
    }
    if (cvar->flags & CVarFlags::read_only) {
        core::Logger::warn("CVar {} is read-only", name);
        return false;
    }
    if (!cvar->setFromString(val)) {
        core::Logger::warn("Failed to set CVar {} from string value: {}", name, val);
        return false;
    }
    return true;
}

size_t CVarSystem::loadFromIni(const std::filesystem::path& path) {
    core::Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());
    std::ifstream f(path);
    if (!f) {
        core::Logger::warn("CVar file not found: {}", path.string());
        return 0;
    }

    size_t loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }
        if (applyAssignment(line)) {
            loadedCount++;
        }
    }
    core::Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

CVar<std::string>::CVar(const char *name, const char *desc,
                        std::string defaultValue, CVarFlags flags,
                        OnChangeFunc onChange)
    : m_value(std::move(defaultValue)),
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

std::string CVar<std::string>::toString() const {
    return m_value;
}

bool CVar<std::string>::setFromString(const std::string& val) {
    set(val);
    return true;
}

}
