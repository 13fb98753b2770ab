#pragma once

#include <cstdint>
#include <string>
#include <functional>
#include <variant>
#include <vector>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace vu
{

// ConVar flags
namespace ConVarFlags
{
    constexpr uint32_t NONE         = 0;
    constexpr uint32_t ARCHIVE      = 1 << 0;   // Saved to config file
    constexpr uint32_t DEVELOPER    = 1 << 1;   // Only meaningful with developer 1
    constexpr uint32_t HIDDEN       = 1 << 2;   // Hidden from findMatching
}

// ConVar value types
using ConVarValue = std::variant<int, float, bool, std::string>;

class ConVarBase;

// Callback signature for value changes
using ConVarCallback = std::function<void(ConVarBase* cvar, const ConVarValue& oldValue, const ConVarValue& newValue)>;

// A named, typed configuration variable. The type is fixed by the default value.
class ConVarBase
{
protected:
    std::string m_name;
    std::string m_description;
    uint32_t m_flags;
    ConVarValue m_defaultValue;
    ConVarValue m_currentValue;
    std::vector<ConVarCallback> m_callbacks;

    // Bounds for numeric types
    std::optional<float> m_minValue;
    std::optional<float> m_maxValue;

public:
    ConVarBase(const std::string& name, int defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, float defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, bool defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, const char* defaultValue, uint32_t flags, const std::string& description);
    ConVarBase(const std::string& name, const std::string& defaultValue, uint32_t flags, const std::string& description);
    virtual ~ConVarBase() = default;

    const std::string& getName() const { return m_name; }
    const std::string& getDescription() const { return m_description; }
    uint32_t getFlags() const { return m_flags; }
    bool hasFlag(uint32_t flag) const { return (m_flags & flag) != 0; }

    // Value access, converted from the stored type
    int getInt() const;
    float getFloat() const;
    bool getBool() const;
    const std::string& getString() const;
    const ConVarValue& getValue() const { return m_currentValue; }
    const ConVarValue& getDefaultValue() const { return m_defaultValue; }

    // Value setting (clamped to bounds, callbacks notified)
    bool setInt(int value);
    bool setFloat(float value);
    bool setBool(bool value);
    bool setString(const std::string& value);
    bool setFromString(const std::string& valueStr);

    void reset();

    void setBounds(float min, float max);
    bool hasBounds() const { return m_minValue.has_value() && m_maxValue.has_value(); }
    float getMinBound() const { return m_minValue.value_or(0.0f); }
    float getMaxBound() const { return m_maxValue.value_or(0.0f); }

    void addChangeCallback(ConVarCallback callback);

    std::string getValueString() const;
    std::string getDefaultValueString() const;

protected:
    void assign(ConVarValue value);
    void clamp(ConVarValue& value) const;
};

// ConVar Registry (Singleton)
class ConVarRegistry
{
public:
    static ConVarRegistry& get();

    void registerConVar(ConVarBase* cvar);
    void unregisterConVar(const std::string& name);

    ConVarBase* find(const std::string& name);
    std::vector<ConVarBase*> findMatching(const std::string& prefix);
    std::vector<ConVarBase*> getAll();
    std::vector<ConVarBase*> getByFlag(uint32_t flag);

    // Config file: "name value" per line, // comments, optional quotes
    bool saveArchiveCvars(const std::string& filepath);
    bool loadConfig(const std::string& filepath);

private:
    ConVarRegistry() = default;
    std::unordered_map<std::string, ConVarBase*> m_cvars;
    mutable std::mutex m_mutex;
};

// Static registration helper
class ConVarRegistrar
{
public:
    ConVarRegistrar(ConVarBase* cvar)
    {
        ConVarRegistry::get().registerConVar(cvar);
    }
};

// Force the render cvars into the registry (call at startup)
void InitializeDefaultCVars();

}

// Creates a file-local ConVar with auto-registration
#define VU_CONVAR(name, defaultVal, flags, description) \
    static ::vu::ConVarBase g_cvar_##name(#name, defaultVal, flags, description); \
    static ::vu::ConVarRegistrar g_cvar_registrar_##name(&g_cvar_##name)

// VU_CONVAR with bounds (for numeric types)
#define VU_CONVAR_BOUNDED(name, defaultVal, minVal, maxVal, flags, description) \
    static ::vu::ConVarBase g_cvar_##name(#name, defaultVal, flags, description); \
    static struct ConVarInit_##name { \
        ConVarInit_##name() { \
            g_cvar_##name.setBounds(static_cast<float>(minVal), static_cast<float>(maxVal)); \
            ::vu::ConVarRegistry::get().registerConVar(&g_cvar_##name); \
        } \
    } g_cvar_init_##name

#define VU_CVAR_PTR(name) ::vu::ConVarRegistry::get().find(#name)
