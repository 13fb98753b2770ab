#include "ConVar.hpp"
#include "Utils/Log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <type_traits>

namespace vu
{

namespace
{
    std::string toLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Whole-string numeric parsing, no exceptions.
    std::optional<long> parseInt(const std::string& s)
    {
        if (s.empty())
        {
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0')
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<float> parseFloat(const std::string& s)
    {
        if (s.empty())
        {
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        float value = std::strtof(s.c_str(), &end);
        if (errno != 0 || end == s.c_str() || *end != '\0')
        {
            return std::nullopt;
        }
        return value;
    }

    std::string valueToString(const ConVarValue& value)
    {
        return std::visit([](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
            {
                return v ? "1" : "0";
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                return v;
            }
            else
            {
                return std::to_string(v);
            }
        }, value);
    }
}

ConVarBase::ConVarBase(const std::string& name, int defaultValue, uint32_t flags, const std::string& description)
    : m_name(name)
    , m_description(description)
    , m_flags(flags)
    , m_defaultValue(defaultValue)
    , m_currentValue(defaultValue)
{
}

ConVarBase::ConVarBase(const std::string& name, float defaultValue, uint32_t flags, const std::string& description)
    : m_name(name)
    , m_description(description)
    , m_flags(flags)
    , m_defaultValue(defaultValue)
    , m_currentValue(defaultValue)
{
}

ConVarBase::ConVarBase(const std::string& name, bool defaultValue, uint32_t flags, const std::string& description)
    : m_name(name)
    , m_description(description)
    , m_flags(flags)
    , m_defaultValue(defaultValue)
    , m_currentValue(defaultValue)
{
}

ConVarBase::ConVarBase(const std::string& name, const char* defaultValue, uint32_t flags, const std::string& description)
    : ConVarBase(name, std::string(defaultValue), flags, description)
{
}

ConVarBase::ConVarBase(const std::string& name, const std::string& defaultValue, uint32_t flags, const std::string& description)
    : m_name(name)
    , m_description(description)
    , m_flags(flags)
    , m_defaultValue(defaultValue)
    , m_currentValue(defaultValue)
{
}

int ConVarBase::getInt() const
{
    return std::visit([](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return static_cast<int>(parseInt(v).value_or(0));
        }
        else
        {
            return static_cast<int>(v);
        }
    }, m_currentValue);
}

float ConVarBase::getFloat() const
{
    return std::visit([](const auto& v) -> float {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return parseFloat(v).value_or(0.0f);
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            return v ? 1.0f : 0.0f;
        }
        else
        {
            return static_cast<float>(v);
        }
    }, m_currentValue);
}

bool ConVarBase::getBool() const
{
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return !v.empty() && v != "0" && toLower(v) != "false";
        }
        else
        {
            return v != T{};
        }
    }, m_currentValue);
}

const std::string& ConVarBase::getString() const
{
    static const std::string s_empty;
    if (const std::string* s = std::get_if<std::string>(&m_currentValue))
    {
        return *s;
    }
    return s_empty;
}

bool ConVarBase::setInt(int value)
{
    assign(value);
    return true;
}

bool ConVarBase::setFloat(float value)
{
    assign(value);
    return true;
}

bool ConVarBase::setBool(bool value)
{
    assign(value);
    return true;
}

bool ConVarBase::setString(const std::string& value)
{
    assign(value);
    return true;
}

// Parses valueStr as the type of the default value. Invalid text leaves the value unchanged.
bool ConVarBase::setFromString(const std::string& valueStr)
{
    if (std::holds_alternative<int>(m_defaultValue))
    {
        std::optional<long> value = parseInt(valueStr);
        if (!value)
        {
            VU_LOG_WARN("ConVar {}: Invalid integer value '{}'", m_name, valueStr);
            return false;
        }
        assign(static_cast<int>(*value));
    }
    else if (std::holds_alternative<float>(m_defaultValue))
    {
        std::optional<float> value = parseFloat(valueStr);
        if (!value)
        {
            VU_LOG_WARN("ConVar {}: Invalid float value '{}'", m_name, valueStr);
            return false;
        }
        assign(*value);
    }
    else if (std::holds_alternative<bool>(m_defaultValue))
    {
        std::string lower = toLower(valueStr);
        assign(lower == "1" || lower == "true" || lower == "yes" || lower == "on");
    }
    else
    {
        assign(valueStr);
    }
    return true;
}

void ConVarBase::reset()
{
    assign(m_defaultValue);
}

void ConVarBase::setBounds(float min, float max)
{
    m_minValue = min;
    m_maxValue = max;
    clamp(m_currentValue);
}

void ConVarBase::addChangeCallback(ConVarCallback callback)
{
    m_callbacks.push_back(std::move(callback));
}

std::string ConVarBase::getValueString() const
{
    return valueToString(m_currentValue);
}

std::string ConVarBase::getDefaultValueString() const
{
    return valueToString(m_defaultValue);
}

void ConVarBase::assign(ConVarValue value)
{
    clamp(value);
    ConVarValue oldValue = m_currentValue;
    m_currentValue = std::move(value);
    for (auto& callback : m_callbacks)
    {
        callback(this, oldValue, m_currentValue);
    }
}

void ConVarBase::clamp(ConVarValue& value) const
{
    if (!hasBounds())
    {
        return;
    }

    if (int* i = std::get_if<int>(&value))
    {
        *i = std::clamp(*i, static_cast<int>(*m_minValue), static_cast<int>(*m_maxValue));
    }
    else if (float* f = std::get_if<float>(&value))
    {
        *f = std::clamp(*f, *m_minValue, *m_maxValue);
    }
}

// ConVarRegistry implementation
ConVarRegistry& ConVarRegistry::get()
{
    static ConVarRegistry instance;
    return instance;
}

void ConVarRegistry::registerConVar(ConVarBase* cvar)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Duplicates keep the first registration; no logging during static init
    m_cvars.emplace(cvar->getName(), cvar);
}

void ConVarRegistry::unregisterConVar(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cvars.erase(name);
}

ConVarBase* ConVarRegistry::find(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cvars.find(name);
    return (it != m_cvars.end()) ? it->second : nullptr;
}

std::vector<ConVarBase*> ConVarRegistry::findMatching(const std::string& prefix)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConVarBase*> result;
    std::string lowerPrefix = toLower(prefix);

    for (auto& [name, cvar] : m_cvars)
    {
        if (cvar->hasFlag(ConVarFlags::HIDDEN))
        {
            continue;
        }
        if (toLower(name).find(lowerPrefix) != std::string::npos)
        {
            result.push_back(cvar);
        }
    }

    std::sort(result.begin(), result.end(), [](ConVarBase* a, ConVarBase* b) {
        return a->getName() < b->getName();
    });
    return result;
}

std::vector<ConVarBase*> ConVarRegistry::getAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConVarBase*> result;
    result.reserve(m_cvars.size());

    for (auto& [name, cvar] : m_cvars)
    {
        result.push_back(cvar);
    }

    std::sort(result.begin(), result.end(), [](ConVarBase* a, ConVarBase* b) {
        return a->getName() < b->getName();
    });
    return result;
}

std::vector<ConVarBase*> ConVarRegistry::getByFlag(uint32_t flag)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConVarBase*> result;

    for (auto& [name, cvar] : m_cvars)
    {
        if (cvar->hasFlag(flag))
        {
            result.push_back(cvar);
        }
    }
    return result;
}

bool ConVarRegistry::saveArchiveCvars(const std::string& filepath)
{
    std::ofstream file(filepath);
    if (!file.is_open())
    {
        VU_LOG_ERROR("Could not write config file: {}", filepath);
        return false;
    }

    file << "// vu render configuration\n\n";

    for (ConVarBase* cvar : getByFlag(ConVarFlags::ARCHIVE))
    {
        const std::string value = cvar->getValueString();
        // Quote empty strings and strings that contain spaces
        if (value.empty() || value.find(' ') != std::string::npos)
        {
            file << cvar->getName() << " \"" << value << "\"\n";
        }
        else
        {
            file << cvar->getName() << " " << value << "\n";
        }
    }

    VU_LOG_INFO("Config saved to {}", filepath);
    return true;
}

bool ConVarRegistry::loadConfig(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        VU_LOG_TRACE("Config file not found: {}", filepath);
        return false;
    }

    VU_LOG_INFO("Loading config: {}", filepath);

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        lineNum++;

        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line.compare(start, 2, "//") == 0)
        {
            continue;
        }

        std::string trimmed = line.substr(start);
        size_t spacePos = trimmed.find_first_of(" \t");
        if (spacePos == std::string::npos)
        {
            VU_LOG_WARN("{}:{}: No value for '{}'", filepath, lineNum, trimmed);
            continue;
        }

        std::string name = trimmed.substr(0, spacePos);
        std::string value = trimmed.substr(spacePos + 1);
        size_t valueStart = value.find_first_not_of(" \t");
        size_t valueEnd = value.find_last_not_of(" \t\r");
        value = (valueStart == std::string::npos) ? std::string() : value.substr(valueStart, valueEnd - valueStart + 1);

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }

        ConVarBase* cvar = find(name);
        if (cvar)
        {
            cvar->setFromString(value);
        }
        else
        {
            VU_LOG_TRACE("{}:{}: Unknown cvar '{}'", filepath, lineNum, name);
        }
    }
    return true;
}

}
