#pragma once

#include <juce_core/juce_core.h>
#include <set>

namespace Saekim::Core
{
    bool isAsciiAlpha(juce::juce_wchar c) noexcept;
    bool isAsciiDigit(juce::juce_wchar c) noexcept;

    // Replaces every character outside [A-Za-z0-9_] with '_' and prefixes a
    // leading digit. Returns fallback when nothing usable remains.
    juce::String sanitizeIdentifier(const juce::String& raw, const juce::String& fallback = "_generated");

    // Dotted namespace: each segment is sanitized on its own, empty segments dropped.
    juce::String sanitizeNamespace(const juce::String& raw, const juce::String& fallback);

    juce::String makeUniqueName(const juce::String& preferredBase, std::set<juce::String>& usedNames);

    juce::String toPascalCase(const juce::String& name);
    juce::String toCamelCase(const juce::String& name);
}
