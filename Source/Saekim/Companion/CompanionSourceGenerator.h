#pragma once

#include "Saekim/Core/LineBuilder.h"
#include "Saekim/Public/ExportTypes.h"
#include <optional>
#include <vector>

namespace Saekim::Companion
{
    struct EventHandlerInfo
    {
        juce::String methodName;
        juce::String eventName;
        juce::String argsType;
        juce::String component;
    };

    struct BindingPropertyInfo
    {
        juce::String name;
        juce::String typeName;
        juce::String targetProperty;
    };

    // Depth-first, first occurrence of each method name wins.
    std::vector<EventHandlerInfo> collectEventHandlers(const std::vector<CanonicalNode>& nodes);

    // Binding paths found in attributes, depth-first, deduplicated. Command bindings are excluded.
    std::vector<BindingPropertyInfo> collectBindingProperties(const std::vector<CanonicalNode>& nodes);

    // Base names of {Binding XCommand} found on Command attributes ("Save" for SaveCommand).
    juce::StringArray collectCommands(const std::vector<CanonicalNode>& nodes);

    // "UserName" for "{Binding UserName, Mode=TwoWay}"; nullopt when the text is not a binding.
    std::optional<juce::String> bindingPath(const juce::String& value);

    juce::String eventArgsTypeFor(const juce::String& eventName);
    juce::String inferPropertyType(const juce::String& targetProperty);

    class CompanionSourceGenerator
    {
    public:
        explicit CompanionSourceGenerator(ExportOptions optionsIn);

        juce::String generateCompanionSource(const std::vector<CanonicalNode>& nodes,
                                             const juce::String& className,
                                             RootKind rootKind) const;

        juce::String generateViewModelSource(const std::vector<CanonicalNode>& nodes,
                                             const juce::String& className) const;

        juce::String generateValueConverter(const juce::String& converterName,
                                            const juce::String& sourceType,
                                            const juce::String& targetType) const;

    private:
        void appendProperty(Core::LineBuilder& out, const BindingPropertyInfo& property) const;
        void appendCommand(Core::LineBuilder& out, const juce::String& commandName) const;

        ExportOptions options;
    };
}
