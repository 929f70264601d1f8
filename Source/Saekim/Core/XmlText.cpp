#include "Saekim/Core/XmlText.h"

#include "Saekim/Convert/ValueConverters.h"

namespace Saekim::Core
{
    juce::String escapeXml(const juce::String& text)
    {
        return text.replace("&", "&amp;")
                   .replace("<", "&lt;")
                   .replace(">", "&gt;")
                   .replace("\"", "&quot;")
                   .replace("'", "&apos;");
    }

    juce::String escapeMarkupValue(const juce::String& text)
    {
        if (Convert::isBindingExpression(text))
            return text;

        return escapeXml(text);
    }

    juce::String xmlAttribute(const juce::String& name, const juce::String& value)
    {
        return name + "=\"" + escapeMarkupValue(value) + "\"";
    }
}
