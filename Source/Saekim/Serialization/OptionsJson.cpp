#include "Saekim/Serialization/OptionsJson.h"

#include "Saekim/Export/ExportPresets.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace
{
    using namespace Saekim;

    using FlagMember = bool ExportOptions::*;
    using TextMember = juce::String ExportOptions::*;

    const std::vector<std::pair<const char*, FlagMember>>& flagKeys()
    {
        static const std::vector<std::pair<const char*, FlagMember>> keys {
            { "includeStyles", &ExportOptions::includeStyles },
            { "includeCodeBehind", &ExportOptions::includeCodeBehind },
            { "includeViewModel", &ExportOptions::includeViewModel },
            { "generateTheme", &ExportOptions::generateTheme },
            { "includeEffects", &ExportOptions::includeEffects },
            { "includeTransforms", &ExportOptions::includeTransforms },
            { "includeGradients", &ExportOptions::includeGradients },
            { "includeDesignTimeData", &ExportOptions::includeDesignTimeData },
            { "includeComments", &ExportOptions::includeComments },
            { "useTabs", &ExportOptions::useTabs }
        };
        return keys;
    }

    const std::vector<std::pair<const char*, TextMember>>& textKeys()
    {
        static const std::vector<std::pair<const char*, TextMember>> keys {
            { "rootNamespace", &ExportOptions::rootNamespace },
            { "className", &ExportOptions::className },
            { "bindingMode", &ExportOptions::bindingMode }
        };
        return keys;
    }

    template <typename Member>
    const std::pair<const char*, Member>* findKey(const std::vector<std::pair<const char*, Member>>& keys,
                                                  const juce::String& name) noexcept
    {
        const auto it = std::find_if(keys.begin(), keys.end(), [&name](const auto& entry)
        {
            return name == entry.first;
        });

        return it == keys.end() ? nullptr : &(*it);
    }

    // false when the value has the wrong type or an unknown enum key.
    bool applyOption(const juce::String& key, const juce::var& value, ExportOptions& options)
    {
        if (const auto* flag = findKey(flagKeys(), key))
        {
            if (!value.isBool())
                return false;
            options.*(flag->second) = static_cast<bool>(value);
            return true;
        }

        if (const auto* text = findKey(textKeys(), key))
        {
            if (!value.isString())
                return false;
            options.*(text->second) = value.toString();
            return true;
        }

        if (key == "rootKind")
        {
            const auto kind = value.isString() ? rootKindFromKey(value.toString()) : std::nullopt;
            if (!kind.has_value())
                return false;
            options.rootKind = *kind;
            return true;
        }

        if (key == "viewModelIdiom")
        {
            const auto idiom = value.isString() ? viewModelIdiomFromKey(value.toString()) : std::nullopt;
            if (!idiom.has_value())
                return false;
            options.viewModelIdiom = *idiom;
            return true;
        }

        if (key == "indentSize")
        {
            if (!isNumericVar(value))
                return false;
            options.indentSize = static_cast<int>(value);
            return true;
        }

        if (key == "paletteOverrides")
        {
            const auto* palette = value.getDynamicObject();
            if (palette == nullptr)
                return false;

            for (const auto& entry : palette->getProperties())
                options.paletteOverrides.set(entry.name.toString(), entry.value.toString());
            return true;
        }

        return false;
    }
}

namespace Saekim::Serialization
{
    juce::Result applyOptionOverrides(const juce::var& overrides,
                                      ExportOptions& optionsInOut,
                                      juce::StringArray* ignoredKeysOut)
    {
        const auto* object = overrides.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("options must be object");

        const auto& props = object->getProperties();
        auto merged = optionsInOut;

        const auto ignore = [ignoredKeysOut](const juce::String& key, const juce::String& reason)
        {
            DBG("[Saekim] option '" + key + "' ignored: " + reason);
            if (ignoredKeysOut != nullptr)
                ignoredKeysOut->add(key);
        };

        if (props.contains("preset"))
        {
            const auto& presetValue = props["preset"];
            const auto preset = presetValue.isString() ? exportPresetFromKey(presetValue.toString()) : std::nullopt;
            if (preset.has_value())
                merged = Export::withPreset(*preset, merged);
            else
                ignore("preset", "unknown preset " + presetValue.toString());
        }

        for (const auto& entry : props)
        {
            const auto key = entry.name.toString();
            if (key == "preset")
                continue;

            const auto known = findKey(flagKeys(), key) != nullptr
                            || findKey(textKeys(), key) != nullptr
                            || juce::StringArray { "rootKind", "viewModelIdiom", "indentSize", "paletteOverrides" }.contains(key);

            if (!known)
                ignore(key, "unknown key");
            else if (!applyOption(key, entry.value, merged))
                ignore(key, "unexpected value " + entry.value.toString());
        }

        optionsInOut = std::move(merged);
        return juce::Result::ok();
    }

    juce::Result loadOptionsFromFile(const juce::File& file,
                                     ExportOptions& optionsInOut,
                                     juce::StringArray* ignoredKeysOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(file.loadFileAsString(), rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        return applyOptionOverrides(rootVar, optionsInOut, ignoredKeysOut);
    }
}
