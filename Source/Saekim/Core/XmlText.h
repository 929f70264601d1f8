#pragma once

#include <juce_core/juce_core.h>

namespace Saekim::Core
{
    // Escapes & < > " ' for use in markup text and attribute values.
    juce::String escapeXml(const juce::String& text);

    // escapeXml(), except that markup extensions ({Binding ...}, {StaticResource ...})
    // are returned verbatim.
    juce::String escapeMarkupValue(const juce::String& text);

    juce::String xmlAttribute(const juce::String& name, const juce::String& value);
}
