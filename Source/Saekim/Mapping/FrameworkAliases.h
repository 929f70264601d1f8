#pragma once

#include "Saekim/Convert/ValueConverters.h"
#include <vector>

namespace Saekim::Mapping
{
    // Framework-agnostic component name (e.g. "PasswordBox") and what it becomes.
    struct ComponentAlias
    {
        juce::String componentType;
        juce::String targetElement;
        juce::String targetNamespace { "Avalonia.Controls" };
        juce::String preferredSourceType;
        juce::String styleClass;
        juce::StringPairArray fixedAttributes { false };
    };

    struct PropertyAlias
    {
        juce::String source;
        juce::String target;
        Convert::ConverterKind converter = Convert::ConverterKind::string;
    };

    class FrameworkAliasRegistry
    {
    public:
        bool registerAlias(ComponentAlias alias);
        bool registerPropertyAlias(PropertyAlias alias);

        // Case-insensitive.
        const ComponentAlias* findComponent(const juce::String& componentType) const noexcept;
        const PropertyAlias* findProperty(const juce::String& source) const noexcept;

        // Target attribute name for a generic property; unknown names are PascalCased.
        juce::String translatePropertyName(const juce::String& source) const;

        const std::vector<ComponentAlias>& components() const noexcept { return componentAliases; }
        const std::vector<PropertyAlias>& properties() const noexcept { return propertyAliases; }

    private:
        std::vector<ComponentAlias> componentAliases;
        std::vector<PropertyAlias> propertyAliases;
    };

    FrameworkAliasRegistry makeDefaultFrameworkAliasRegistry();
    const FrameworkAliasRegistry& defaultFrameworkAliasRegistry();
}
