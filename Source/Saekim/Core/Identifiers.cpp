#include "Saekim/Core/Identifiers.h"

namespace Saekim::Core
{
    bool isAsciiAlpha(juce::juce_wchar c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    bool isAsciiDigit(juce::juce_wchar c) noexcept
    {
        return c >= '0' && c <= '9';
    }

    juce::String sanitizeIdentifier(const juce::String& raw, const juce::String& fallback)
    {
        const auto trimmed = raw.trim();
        juce::String sanitized;
        sanitized.preallocateBytes(static_cast<size_t>(trimmed.length()) + 8);

        for (int i = 0; i < trimmed.length(); ++i)
        {
            const auto c = trimmed[i];
            const auto keep = isAsciiAlpha(c) || isAsciiDigit(c) || c == '_';

            if (i == 0 && isAsciiDigit(c))
                sanitized << "_";

            if (keep)
                sanitized << juce::String::charToString(c);
            else
                sanitized << "_";
        }

        if (sanitized.isEmpty() || sanitized.containsOnly("_"))
            return fallback;

        return sanitized;
    }

    juce::String sanitizeNamespace(const juce::String& raw, const juce::String& fallback)
    {
        juce::StringArray segments;
        segments.addTokens(raw.trim(), ".", {});
        segments.trim();
        segments.removeEmptyStrings();

        juce::StringArray sanitizedSegments;
        for (const auto& segment : segments)
        {
            const auto sanitized = sanitizeIdentifier(segment, {});
            if (sanitized.isNotEmpty())
                sanitizedSegments.add(sanitized);
        }

        if (sanitizedSegments.isEmpty())
            return fallback;

        return sanitizedSegments.joinIntoString(".");
    }

    juce::String makeUniqueName(const juce::String& preferredBase, std::set<juce::String>& usedNames)
    {
        const auto base = sanitizeIdentifier(preferredBase);
        if (usedNames.insert(base).second)
            return base;

        for (int suffix = 2;; ++suffix)
        {
            const auto candidate = base + juce::String(suffix);
            if (usedNames.insert(candidate).second)
                return candidate;
        }
    }

    juce::String toPascalCase(const juce::String& name)
    {
        if (name.isEmpty())
            return {};

        return name.substring(0, 1).toUpperCase() + name.substring(1);
    }

    juce::String toCamelCase(const juce::String& name)
    {
        if (name.isEmpty())
            return {};

        return name.substring(0, 1).toLowerCase() + name.substring(1);
    }
}
