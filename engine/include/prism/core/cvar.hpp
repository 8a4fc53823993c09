#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace prism::core {

enum class CVarFlags : uint32_t {
    none = 0,
    read_only = 1 << 0,
};

inline CVarFlags operator|(CVarFlags a, CVarFlags b) {
    return static_cast<CVarFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(CVarFlags a, CVarFlags b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

struct ICVar {
    std::string name;
    std::string description;
    CVarFlags flags;
    virtual ~ICVar() = default;
    virtual std::string toString() const = 0;
    // Returns false when val cannot be parsed; the value is left unchanged.
    virtual bool setFromString(const std::string& val) = 0;
};

class CVarSystem {
public:
    static void registerCVar(ICVar* cvar);
    static ICVar* find(const std::string& name);

    // "name=value". Unknown names, read-only cvars and unparsable values are logged and rejected.
    static bool applyAssignment(std::string_view assignment);

    static size_t loadFromIni(const std::filesystem::path& path);
};

template <typename T>
class CVar : public ICVar {
    static_assert(std::is_arithmetic_v<T>, "Generic CVar only supports arithmetic types. Use specializations for others.");
public:
    using OnChangeFunc = std::function<void(T)>;

    CVar(const char* name, const char* desc, T defaultValue, CVarFlags flags = CVarFlags::none, OnChangeFunc onChange = nullptr)
        : m_onChange(std::move(onChange))
    {
        this->name = name;
        this->description = desc;
        this->flags = flags;
        m_value.store(defaultValue, std::memory_order_relaxed);
        CVarSystem::registerCVar(this);
    }

    T get() const {
        return m_value.load(std::memory_order_relaxed);
    }

    void set(T val) {
        m_value.store(val, std::memory_order_relaxed);
        if (m_onChange) m_onChange(val);
    }

    std::string toString() const override {
        if constexpr (std::is_same_v<T, bool>) {
            return get() ? "true" : "false";
        } else {
            return std::to_string(get());
        }
    }

    bool setFromString(const std::string& val) override {
        T newValue{};
        if constexpr (std::is_same_v<T, bool>) {
            if (val == "1" || val == "true" || val == "True") {
                newValue = true;
            } else if (val == "0" || val == "false" || val == "False") {
                newValue = false;
            } else {
                return false;
            }
        } else {
            size_t consumed = 0;
            try {
                if constexpr (std::is_floating_point_v<T>) {
                    newValue = static_cast<T>(std::stod(val, &consumed));
                } else {
                    const long long parsed = std::stoll(val, &consumed);
                    if (parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
                        (parsed > 0 && static_cast<unsigned long long>(parsed) >
                                           static_cast<unsigned long long>(std::numeric_limits<T>::max()))) {
                        return false;
                    }
                    newValue = static_cast<T>(parsed);
                }
            } catch (const std::logic_error&) {
                return false;
            }
            if (consumed != val.size()) {
                return false;
            }
        }
        set(newValue);
        return true;
    }

private:
    std::atomic<T> m_value;
    OnChangeFunc m_onChange;
};

template <>
class CVar<std::string> : public ICVar {
public:
    using OnChangeFunc = std::function<void(std::string)>;

    CVar(const char* name, const char* desc, std::string defaultValue, CVarFlags flags = CVarFlags::none, OnChangeFunc onChange = nullptr);

    std::string get() const;
    void set(std::string val);

    std::string toString() const override;
    bool setFromString(const std::string& val) override;

private:
    std::string m_value;
    OnChangeFunc m_onChange;
};

#define AUTO_CVAR_FLOAT(Name, Desc, Default, ...) prism::core::CVar<float> Name(#Name, Desc, Default, ##__VA_ARGS__)
#define AUTO_CVAR_INT(Name, Desc, Default, ...) prism::core::CVar<int> Name(#Name, Desc, Default, ##__VA_ARGS__)
#define AUTO_CVAR_BOOL(Name, Desc, Default, ...) prism::core::CVar<bool> Name(#Name, Desc, Default, ##__VA_ARGS__)
#define AUTO_CVAR_STRING(Name, Desc, Default, ...) prism::core::CVar<std::string> Name(#Name, Desc, Default, ##__VA_ARGS__)

}
