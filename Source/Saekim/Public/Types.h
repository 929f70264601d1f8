#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <vector>

namespace Saekim
{
    using PropertyBag = juce::NamedValueSet;

    constexpr int kMaxTreeDepth = 64;

    struct SceneNode
    {
        juce::String type;
        juce::String targetType;
        juce::String targetNamespace;
        juce::String name;
        std::optional<double> x;
        std::optional<double> y;
        PropertyBag properties;
        std::vector<SceneNode> children;
    };

    struct SceneLayer
    {
        juce::String name;
        bool visible = true;
        std::vector<SceneNode> nodes;
    };

    // Resources are keyed by name; values are colour strings, plain strings,
    // or style objects ({ "type": "style", "selector": ..., "setters": {...} }).
    struct SceneResource
    {
        juce::String key;
        juce::var value;
    };

    struct SceneModel
    {
        juce::String title;
        std::optional<double> width;
        std::optional<double> height;
        std::vector<SceneLayer> layers;
        std::vector<SceneNode> nodes;
        std::vector<SceneResource> resources;
    };

    struct CanonicalNode
    {
        juce::String sourceType;
        juce::String targetType;
        juce::String targetNamespace { "Avalonia.Controls" };
        juce::String name;
        juce::String styleClass;
        juce::String contentProperty;

        juce::StringPairArray attributes { false };
        juce::StringPairArray nestedProperties { false };
        juce::StringPairArray attachedProperties { false };
        juce::StringPairArray events { false };

        std::vector<CanonicalNode> children;
        std::optional<juce::String> textContent;
        bool supported = true;

        bool hasContent() const noexcept
        {
            return !children.empty() || nestedProperties.size() > 0 || textContent.has_value();
        }
    };

    inline bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    inline int countNodes(const std::vector<CanonicalNode>& nodes) noexcept
    {
        int count = 0;
        for (const auto& node : nodes)
            count += 1 + countNodes(node.children);
        return count;
    }
}
