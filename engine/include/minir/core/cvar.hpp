#pragma once

/**
 * @file cvar.hpp
 * @brief Named, ini-persisted tunables (culling radius, log cadence, ...)
 */

#include <atomic>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace minir::core {

enum class CVarFlags : uint32_t {
    none = 0,
    save = 1 << 0,      // written by saveToIni
    read_only = 1 << 1, // never assigned from a file
};

constexpr CVarFlags operator|(CVarFlags a, CVarFlags b) {
    return static_cast<CVarFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr bool operator&(CVarFlags a, CVarFlags b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

struct ICVar {
    std::string name;
    std::string description;
    CVarFlags flags = CVarFlags::none;

    virtual ~ICVar() = default;
    [[nodiscard]] virtual std::string toString() const = 0;
    // Throws std::invalid_argument or std::out_of_range; the value is unchanged then.
    virtual void setFromString(const std::string& text) = 0;
};

class CVarSystem {
public:
    using Registry = std::map<std::string, ICVar*, std::less<>>;

    // First registration of a name wins; later ones are ignored with a warning.
    static void registerCVar(ICVar* cvar);
    static void unregisterCVar(ICVar* cvar);
    [[nodiscard]] static ICVar* find(std::string_view name);
    [[nodiscard]] static const Registry& getAll();

    // Writes every cvar flagged `save`, sorted by name.
    static void saveToIni(const std::filesystem::path& path);
    // Returns how many cvars were assigned from the file.
    static int loadFromIni(const std::filesystem::path& path);
};

namespace detail {

bool parseBool(std::string_view text);

template <typename T>
T parseNumber(std::string_view text) {
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range(std::format("'{}' is out of range", text));
    }
    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(std::format("'{}' is not a number", text));
    }
    return value;
}

} // namespace detail

template <typename T>
class CVar : public ICVar {
    static_assert(std::is_arithmetic_v<T>, "CVar<T> needs an arithmetic T or std::string");

public:
    using OnChangeFunc = std::function<void(T)>;

    CVar(const char* cvarName, const char* desc, T defaultValue,
         CVarFlags cvarFlags = CVarFlags::none, OnChangeFunc onChange = nullptr)
        : m_value(defaultValue), m_default(defaultValue), m_onChange(std::move(onChange))
    {
        name = cvarName;
        description = desc;
        flags = cvarFlags;
        CVarSystem::registerCVar(this);
    }

    ~CVar() override { CVarSystem::unregisterCVar(this); }

    CVar(const CVar&) = delete;
    CVar& operator=(const CVar&) = delete;

    [[nodiscard]] T get() const { return m_value.load(std::memory_order_relaxed); }

    void set(T value) {
        m_value.store(value, std::memory_order_relaxed);
        if (m_onChange) {
            m_onChange(value);
        }
    }

    void reset() { set(m_default); }
    [[nodiscard]] T defaultValue() const { return m_default; }

    [[nodiscard]] std::string toString() const override { return std::format("{}", get()); }

    void setFromString(const std::string& text) override {
        if constexpr (std::is_same_v<T, bool>) {
            set(detail::parseBool(text));
        } else {
            set(detail::parseNumber<T>(text));
        }
    }

private:
    std::atomic<T> m_value;
    T m_default;
    OnChangeFunc m_onChange;
};

template <>
class CVar<std::string> : public ICVar {
public:
    using OnChangeFunc = std::function<void(const std::string&)>;

    CVar(const char* cvarName, const char* desc, std::string defaultValue,
         CVarFlags cvarFlags = CVarFlags::none, OnChangeFunc onChange = nullptr);
    ~CVar() override;

    CVar(const CVar&) = delete;
    CVar& operator=(const CVar&) = delete;

    [[nodiscard]] const std::string& get() const { return m_value; }
    void set(std::string value);

    [[nodiscard]] std::string toString() const override { return m_value; }
    void setFromString(const std::string& text) override { set(text); }

private:
    std::string m_value;
    OnChangeFunc m_onChange;
};

#define AUTO_CVAR_FLOAT(Name, Desc, Default, ...) minir::core::CVar<float> Name(#Name, Desc, Default, ##__VA_ARGS__)
#define AUTO_CVAR_BOOL(Name, Desc, Default, ...) minir::core::CVar<bool> Name(#Name, Desc, Default, ##__VA_ARGS__)

}
