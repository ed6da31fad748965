#include "minir/core/cvar.hpp"
#include "minir/core/common.hpp"
#include "minir/core/logger.hpp"
#include <fstream>

namespace minir::core {

namespace {

CVarSystem::Registry& registry() {
    static CVarSystem::Registry cvars;
    return cvars;
}

std::string_view trim(std::string_view s) {
    const size_t first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}

bool detail::parseBool(std::string_view text) {
    if (text == "1" || util::iequals(text, "true") || util::iequals(text, "on")) {
        return true;
    }
    if (text == "0" || util::iequals(text, "false") || util::iequals(text, "off")) {
        return false;
    }
    throw std::invalid_argument(std::format("'{}' is not a boolean", text));
}

void CVarSystem::registerCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto [it, inserted] = registry().try_emplace(cvar->name, cvar);
    if (!inserted) {
        Logger::Core.warn("CVar '{}' registered twice, keeping the first", cvar->name);
    }
}

void CVarSystem::unregisterCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto it = registry().find(cvar->name);
    if (it != registry().end() && it->second == cvar) {
        registry().erase(it);
    }
}

ICVar* CVarSystem::find(std::string_view name) {
    auto it = registry().find(name);
    return it != registry().end() ? it->second : nullptr;
}

const CVarSystem::Registry& CVarSystem::getAll() {
    return registry();
}

void CVarSystem::saveToIni(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        Logger::Core.error("Cannot write cvars to {}", path.string());
        return;
    }

    int written = 0;
    for (const auto& [name, cvar] : registry()) {
        if (!(cvar->flags & CVarFlags::save)) {
            continue;
        }
        out << "; " << cvar->description << '\n' << name << " = " << cvar->toString() << '\n';
        ++written;
    }
    Logger::Core.debug("Wrote {} cvar(s) to {}", written, path.string());
}

int CVarSystem::loadFromIni(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        Logger::Core.warn("CVar file {} not readable", path.string());
        return 0;
    }

    int assigned = 0;
    int lineNo = 0;
    std::string raw;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string_view line = trim(raw);
        if (line.empty() || line.front() == ';' || line.front() == '#' || line.front() == '[') {
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            Logger::Core.debug("{}:{}: no '=' in line, skipped", path.string(), lineNo);
            continue;
        }

        const std::string_view key = trim(line.substr(0, eq));
        const std::string value(trim(line.substr(eq + 1)));

        ICVar* cvar = find(key);
        if (cvar == nullptr) {
            Logger::Core.debug("{}:{}: unknown cvar '{}'", path.string(), lineNo, key);
            continue;
        }
        if (cvar->flags & CVarFlags::read_only) {
            Logger::Core.warn("{}:{}: '{}' is read-only", path.string(), lineNo, key);
            continue;
        }

        try {
            cvar->setFromString(value);
            ++assigned;
        } catch (const std::logic_error& e) {
            // invalid_argument and out_of_range both land here.
            Logger::Core.warn("{}:{}: {} rejected: {}", path.string(), lineNo, key, e.what());
        }
    }
    return assigned;
}

CVar<std::string>::CVar(const char* cvarName, const char* desc, std::string defaultValue,
                        CVarFlags cvarFlags, OnChangeFunc onChange)
    : m_value(std::move(defaultValue)), m_onChange(std::move(onChange)) {
    name = cvarName;
    description = desc;
    flags = cvarFlags;
    CVarSystem::registerCVar(this);
}

CVar<std::string>::~CVar() {
    CVarSystem::unregisterCVar(this);
}

void CVar<std::string>::set(std::string value) {
    m_value = std::move(value);
    if (m_onChange) {
        m_onChange(m_value);
    }
}

}
