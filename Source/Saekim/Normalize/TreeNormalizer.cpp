#include "Saekim/Normalize/TreeNormalizer.h"

#include "Saekim/Core/Identifiers.h"
#include <set>

namespace
{
    using Saekim::CanonicalNode;
    using Saekim::Convert::ConverterKind;
    using Saekim::Mapping::PropertyRule;

    enum class Gate
    {
        always,
        effects,
        transforms
    };

    struct ExtraRule
    {
        PropertyRule rule;
        Gate gate = Gate::always;
    };

    struct EventRule
    {
        const char* source;
        const char* eventName;
    };

    constexpr EventRule kEventRules[] = {
        { "onClick", "Click" },
        { "onSelectionChanged", "SelectionChanged" },
        { "onTextChanged", "TextChanged" }
    };

    const std::vector<PropertyRule>& layoutRules()
    {
        static const std::vector<PropertyRule> rules {
            { "width", "Width", ConverterKind::dimension, "Auto" },
            { "height", "Height", ConverterKind::dimension, "Auto" },
            { "minWidth", "MinWidth", ConverterKind::dimension, 0 },
            { "minHeight", "MinHeight", ConverterKind::dimension, 0 },
            { "maxWidth", "MaxWidth", ConverterKind::dimension, "Infinity" },
            { "maxHeight", "MaxHeight", ConverterKind::dimension, "Infinity" },
            { "margin", "Margin", ConverterKind::thickness, 0 },
            { "padding", "Padding", ConverterKind::thickness, 0 },
            { "horizontalAlignment", "HorizontalAlignment", ConverterKind::horizontalAlignment, "Stretch" },
            { "verticalAlignment", "VerticalAlignment", ConverterKind::verticalAlignment, "Stretch" },
            { "isEnabled", "IsEnabled", ConverterKind::boolean, true },
            { "isVisible", "IsVisible", ConverterKind::boolean, true },
            { "opacity", "Opacity", ConverterKind::number, 1 }
        };
        return rules;
    }

    const std::vector<ExtraRule>& extraRules()
    {
        static const std::vector<ExtraRule> rules {
            { { "tooltip", "ToolTip.Tip", ConverterKind::string, {} }, Gate::always },
            { { "transformOrigin", "RenderTransformOrigin", ConverterKind::point, {} }, Gate::transforms },
            { { "effect", "Effect", ConverterKind::effect, {} }, Gate::effects },
            { { "transform", "RenderTransform", ConverterKind::transform, {} }, Gate::transforms }
        };
        return rules;
    }

    // Canvas.Left/Canvas.Top come from the node position and sit between these two groups.
    const std::vector<PropertyRule>& leadingAttachedRules()
    {
        static const std::vector<PropertyRule> rules {
            { "gridRow", "Grid.Row", ConverterKind::integer, 0 },
            { "gridColumn", "Grid.Column", ConverterKind::integer, 0 },
            { "gridRowSpan", "Grid.RowSpan", ConverterKind::integer, 1 },
            { "gridColumnSpan", "Grid.ColumnSpan", ConverterKind::integer, 1 },
            { "dock", "DockPanel.Dock", ConverterKind::dock, {} }
        };
        return rules;
    }

    const std::vector<PropertyRule>& trailingAttachedRules()
    {
        static const std::vector<PropertyRule> rules {
            { "canvasRight", "Canvas.Right", ConverterKind::number, {} },
            { "canvasBottom", "Canvas.Bottom", ConverterKind::number, {} },
            { "zIndex", "Panel.ZIndex", ConverterKind::integer, 0 }
        };
        return rules;
    }

    // Property names owned by the standard tables; generic translation leaves them alone.
    const juce::StringArray& reservedPropertyNames()
    {
        static const juce::StringArray names = []
        {
            juce::StringArray collected { "name" };
            for (const auto& rule : layoutRules())
                collected.add(rule.source);
            for (const auto& extra : extraRules())
                collected.add(extra.rule.source);
            for (const auto& event : kEventRules)
                collected.add(event.source);
            for (const auto& rule : leadingAttachedRules())
                collected.add(rule.source);
            for (const auto& rule : trailingAttachedRules())
                collected.add(rule.source);
            return collected;
        }();
        return names;
    }

    bool hasKey(const juce::StringPairArray& pairs, const juce::String& key)
    {
        return pairs.getAllKeys().contains(key);
    }

    bool isTargetTaken(const CanonicalNode& node, const juce::String& target)
    {
        if (hasKey(node.attributes, target) || hasKey(node.nestedProperties, target))
            return true;
        return node.textContent.has_value() && target == node.contentProperty;
    }

    bool isGradientFragment(const juce::String& text)
    {
        const auto trimmed = text.trimStart();
        return trimmed.startsWith("<LinearGradientBrush") || trimmed.startsWith("<RadialGradientBrush");
    }

    bool isBlank(const juce::var& value)
    {
        if (value.isVoid() || value.isUndefined())
            return true;
        return value.isString() && value.toString().isEmpty();
    }

    juce::String describeNode(const Saekim::SceneNode& node)
    {
        const auto type = node.type.isNotEmpty() ? node.type : node.targetType;
        if (node.name.isNotEmpty())
            return type + " '" + node.name + "'";
        return type;
    }

    void collectCounts(const std::vector<CanonicalNode>& nodes, int& supported, int& unsupported)
    {
        for (const auto& node : nodes)
        {
            if (node.supported)
                ++supported;
            else
                ++unsupported;
            collectCounts(node.children, supported, unsupported);
        }
    }
}

namespace Saekim::Normalize
{
    struct TreeNormalizer::Pass
    {
        ExportReport& report;
        std::set<juce::String> usedNames;
    };

    struct TreeNormalizer::Resolution
    {
        const Mapping::ControlMapping* mapping = nullptr;
        const Mapping::ComponentAlias* alias = nullptr;
        juce::String targetElement;
        juce::String targetNamespace { "Avalonia.Controls" };
        bool generic = false;
        bool placeholder = false;
    };

    std::vector<FlatNode> flattenScene(const SceneModel& scene)
    {
        std::vector<FlatNode> flat;

        for (size_t layerIndex = 0; layerIndex < scene.layers.size(); ++layerIndex)
        {
            const auto& layer = scene.layers[layerIndex];
            if (!layer.visible)
            {
                DBG("[Saekim] Hidden layer skipped: " + layer.name);
                continue;
            }

            for (size_t nodeIndex = 0; nodeIndex < layer.nodes.size(); ++nodeIndex)
            {
                flat.push_back({ &layer.nodes[nodeIndex],
                                 "scene.layers[" + juce::String(static_cast<int>(layerIndex))
                                     + "].nodes[" + juce::String(static_cast<int>(nodeIndex)) + "]" });
            }
        }

        for (size_t nodeIndex = 0; nodeIndex < scene.nodes.size(); ++nodeIndex)
            flat.push_back({ &scene.nodes[nodeIndex], "scene.nodes[" + juce::String(static_cast<int>(nodeIndex)) + "]" });

        return flat;
    }

    TreeNormalizer::TreeNormalizer(const Mapping::MappingRegistry& mappingsIn,
                                   const Mapping::FrameworkAliasRegistry& aliasesIn,
                                   const Convert::ValueConverterSet& convertersIn,
                                   ExportOptions optionsIn)
        : mappings(mappingsIn),
          aliases(aliasesIn),
          converters(convertersIn),
          options(std::move(optionsIn))
    {
        convertOptions.bindingMode = options.bindingMode;
        convertOptions.indentUnit = options.indentUnit();
    }

    juce::Result TreeNormalizer::normalize(const SceneModel& scene,
                                           std::vector<CanonicalNode>& nodesOut,
                                           ExportReport& reportOut) const
    {
        nodesOut.clear();
        Pass pass { reportOut, {} };

        for (const auto& flat : flattenScene(scene))
        {
            CanonicalNode node;
            const auto result = normalizeNode(*flat.node, 1, flat.path, pass, node);
            if (result.failed())
            {
                nodesOut.clear();
                return result;
            }

            nodesOut.push_back(std::move(node));
        }

        int supported = 0;
        int unsupported = 0;
        collectCounts(nodesOut, supported, unsupported);
        reportOut.nodeCount = supported + unsupported;
        reportOut.supportedCount = supported;
        reportOut.unsupportedCount = unsupported;
        return juce::Result::ok();
    }

    TreeNormalizer::Resolution TreeNormalizer::resolve(const SceneNode& source) const
    {
        Resolution resolution;

        const auto explicitTarget = source.targetType.trim();
        if (explicitTarget.isNotEmpty())
        {
            resolution.targetElement = explicitTarget;
            resolution.mapping = mappings.findByTargetElement(explicitTarget);
            resolution.generic = resolution.mapping == nullptr;
            if (resolution.mapping != nullptr)
                resolution.targetNamespace = resolution.mapping->targetNamespace;
        }
        else if (const auto* alias = aliases.findComponent(source.type))
        {
            resolution.alias = alias;
            resolution.targetElement = alias->targetElement;
            resolution.targetNamespace = alias->targetNamespace;
            resolution.mapping = alias->preferredSourceType.isNotEmpty()
                                     ? mappings.findBySourceType(alias->preferredSourceType)
                                     : mappings.findByTargetElement(alias->targetElement);
            resolution.generic = resolution.mapping == nullptr;
        }
        else if (const auto* mapping = mappings.findBySourceType(source.type.trim()))
        {
            resolution.mapping = mapping;
            resolution.targetElement = mapping->targetElement;
            resolution.targetNamespace = mapping->targetNamespace;
        }
        else
        {
            resolution.placeholder = true;
            resolution.targetElement = "ContentControl";
        }

        if (source.targetNamespace.trim().isNotEmpty())
            resolution.targetNamespace = source.targetNamespace.trim();

        return resolution;
    }

    juce::Result TreeNormalizer::normalizeNode(const SceneNode& source,
                                               int depth,
                                               const juce::String& rootPath,
                                               Pass& pass,
                                               CanonicalNode& nodeOut) const
    {
        if (depth > kMaxTreeDepth)
        {
            return juce::Result::fail("Scene tree at " + rootPath + " is nested deeper than "
                                      + juce::String(kMaxTreeDepth) + " levels");
        }

        const auto label = describeNode(source);
        const auto resolution = resolve(source);

        nodeOut.sourceType = source.type.isNotEmpty() ? source.type : source.targetType;
        nodeOut.targetType = resolution.targetElement;
        nodeOut.targetNamespace = resolution.targetNamespace;

        if (resolution.mapping != nullptr)
        {
            nodeOut.styleClass = resolution.mapping->styleClass;
            nodeOut.contentProperty = resolution.mapping->contentProperty;
        }
        if (resolution.alias != nullptr && resolution.alias->styleClass.isNotEmpty())
            nodeOut.styleClass = resolution.alias->styleClass;

        auto rawName = source.name;
        if (rawName.isEmpty() && source.properties.contains("name"))
            rawName = Convert::varToText(source.properties["name"]);
        if (rawName.trim().isNotEmpty())
        {
            const auto sanitized = Core::sanitizeIdentifier(rawName.trim(), {});
            if (sanitized.isNotEmpty())
                nodeOut.name = Core::makeUniqueName(sanitized, pass.usedNames);
            else
                pass.report.addIssue(IssueSeverity::warning, label + ": name '" + rawName + "' has no usable identifier characters");
        }

        if (resolution.placeholder)
        {
            nodeOut.supported = false;
            nodeOut.attributes.set("Tag", nodeOut.sourceType);
            pass.report.addIssue(IssueSeverity::warning,
                                 "Unmapped component type '" + nodeOut.sourceType + "' exported as ContentControl placeholder");
        }
        else if (resolution.generic)
        {
            applyGenericProperties(source, label, pass, nodeOut);
        }
        else
        {
            applyMappedProperties(source, *resolution.mapping, label, pass, nodeOut);
        }

        if (resolution.alias != nullptr)
        {
            for (const auto& key : resolution.alias->fixedAttributes.getAllKeys())
            {
                if (!isTargetTaken(nodeOut, key))
                    nodeOut.attributes.set(key, resolution.alias->fixedAttributes[key]);
            }
        }

        applyStandardProperties(source, label, pass, nodeOut);
        applyAttachedProperties(source, label, pass, nodeOut);

        for (const auto& child : source.children)
        {
            CanonicalNode childNode;
            const auto result = normalizeNode(child, depth + 1, rootPath, pass, childNode);
            if (result.failed())
                return result;

            if (resolution.mapping != nullptr && !resolution.mapping->attachedProperties.isEmpty())
                dropUnhonouredAttachedProperties(*resolution.mapping, describeNode(child), pass, childNode);

            nodeOut.children.push_back(std::move(childNode));
        }

        return juce::Result::ok();
    }

    void TreeNormalizer::applyRule(const Mapping::PropertyRule& rule,
                                   const juce::var& value,
                                   const juce::String& label,
                                   Pass& pass,
                                   CanonicalNode& nodeOut) const
    {
        if (isBlank(value))
        {
            ++pass.report.skippedPropertyCount;
            return;
        }

        if (isTargetTaken(nodeOut, rule.target))
            return;

        std::optional<Convert::ConverterResult> converted;
        const auto status = converters.tryConvert(value, rule.converter, convertOptions, converted);
        if (status.failed())
        {
            ++pass.report.skippedPropertyCount;
            pass.report.addIssue(IssueSeverity::warning,
                                 label + ": property '" + rule.source + "' omitted (" + status.getErrorMessage() + ")");
            return;
        }

        if (!converted.has_value() || converted->text.isEmpty())
        {
            ++pass.report.skippedPropertyCount;
            return;
        }

        if (converted->fragment)
        {
            if (!options.includeGradients && isGradientFragment(converted->text))
            {
                ++pass.report.skippedPropertyCount;
                pass.report.addIssue(IssueSeverity::info,
                                     label + ": gradient for '" + rule.source + "' omitted because gradients are disabled");
                return;
            }

            nodeOut.nestedProperties.set(rule.target, converted->text);
            ++pass.report.convertedPropertyCount;
            return;
        }

        if (!rule.defaultValue.isVoid())
        {
            const auto defaultText = converters.convert(rule.defaultValue, rule.converter, convertOptions);
            if (defaultText.has_value() && defaultText->text == converted->text)
            {
                ++pass.report.skippedPropertyCount;
                return;
            }
        }

        if (rule.target == nodeOut.contentProperty && converted->text.containsChar('\n'))
            nodeOut.textContent = converted->text;
        else
            nodeOut.attributes.set(rule.target, converted->text);

        ++pass.report.convertedPropertyCount;
    }

    void TreeNormalizer::applyMappedProperties(const SceneNode& source,
                                               const Mapping::ControlMapping& mapping,
                                               const juce::String& label,
                                               Pass& pass,
                                               CanonicalNode& nodeOut) const
    {
        for (const auto& rule : mapping.rules)
        {
            if (source.properties.contains(rule.source))
                applyRule(rule, source.properties[rule.source], label, pass, nodeOut);
        }

        for (const auto& key : mapping.fixedAttributes.getAllKeys())
        {
            if (!isTargetTaken(nodeOut, key))
                nodeOut.attributes.set(key, mapping.fixedAttributes[key]);
        }
    }

    void TreeNormalizer::applyGenericProperties(const SceneNode& source,
                                                const juce::String& label,
                                                Pass& pass,
                                                CanonicalNode& nodeOut) const
    {
        const auto& reserved = reservedPropertyNames();
        juce::StringArray handled;

        for (const auto& alias : aliases.properties())
        {
            if (reserved.contains(alias.source) || !source.properties.contains(alias.source))
                continue;

            handled.add(alias.source);
            applyRule({ alias.source, alias.target, alias.converter, {} }, source.properties[alias.source], label, pass, nodeOut);
        }

        juce::StringArray remaining;
        for (const auto& property : source.properties)
        {
            const auto key = property.name.toString();
            if (!reserved.contains(key) && !handled.contains(key))
                remaining.add(key);
        }
        remaining.sort(false);

        for (const auto& key : remaining)
        {
            const auto& value = source.properties[key];
            auto converter = ConverterKind::string;

            if (value.isBool())
                converter = ConverterKind::boolean;
            else if (isNumericVar(value))
                converter = ConverterKind::number;
            else if (value.isArray() || value.isObject())
            {
                ++pass.report.skippedPropertyCount;
                pass.report.addIssue(IssueSeverity::warning,
                                     label + ": structured property '" + key + "' has no generic mapping and was skipped");
                continue;
            }

            applyRule({ key, aliases.translatePropertyName(key), converter, {} }, value, label, pass, nodeOut);
        }
    }

    void TreeNormalizer::applyStandardProperties(const SceneNode& source,
                                                 const juce::String& label,
                                                 Pass& pass,
                                                 CanonicalNode& nodeOut) const
    {
        for (const auto& rule : layoutRules())
        {
            if (source.properties.contains(rule.source))
                applyRule(rule, source.properties[rule.source], label, pass, nodeOut);
        }

        for (const auto& extra : extraRules())
        {
            if (!source.properties.contains(extra.rule.source))
                continue;

            const auto enabled = extra.gate == Gate::always
                              || (extra.gate == Gate::effects && options.includeEffects)
                              || (extra.gate == Gate::transforms && options.includeTransforms);
            if (!enabled)
            {
                ++pass.report.skippedPropertyCount;
                continue;
            }

            applyRule(extra.rule, source.properties[extra.rule.source], label, pass, nodeOut);
        }

        for (const auto& event : kEventRules)
        {
            if (!source.properties.contains(event.source))
                continue;

            const auto raw = Convert::varToText(source.properties[event.source]).trim();
            if (raw.isEmpty())
                continue;

            const auto handler = Core::sanitizeIdentifier(raw, {});
            if (handler.isEmpty())
            {
                ++pass.report.skippedPropertyCount;
                pass.report.addIssue(IssueSeverity::warning,
                                     label + ": event handler '" + raw + "' is not a valid method name");
                continue;
            }

            nodeOut.attributes.set(event.eventName, handler);
            nodeOut.events.set(event.eventName, handler);
            ++pass.report.convertedPropertyCount;
        }
    }

    void TreeNormalizer::applyAttachedProperties(const SceneNode& source,
                                                 const juce::String& label,
                                                 Pass& pass,
                                                 CanonicalNode& nodeOut) const
    {
        auto applyAttached = [&](const Mapping::PropertyRule& rule)
        {
            if (!source.properties.contains(rule.source))
                return;

            CanonicalNode scratch;
            applyRule(rule, source.properties[rule.source], label, pass, scratch);

            if (hasKey(scratch.attributes, rule.target) && !hasKey(nodeOut.attachedProperties, rule.target))
                nodeOut.attachedProperties.set(rule.target, scratch.attributes[rule.target]);
        };

        for (const auto& rule : leadingAttachedRules())
            applyAttached(rule);

        auto applyPosition = [&](const std::optional<double>& coordinate, const char* target)
        {
            if (!coordinate.has_value() || *coordinate == 0.0)
                return;

            const auto text = Convert::formatNumber(*coordinate);
            if (text.isNotEmpty())
                nodeOut.attachedProperties.set(target, text);
        };

        applyPosition(source.x, "Canvas.Left");
        applyPosition(source.y, "Canvas.Top");

        for (const auto& rule : trailingAttachedRules())
            applyAttached(rule);
    }

    void TreeNormalizer::dropUnhonouredAttachedProperties(const Mapping::ControlMapping& parent,
                                                          const juce::String& childLabel,
                                                          Pass& pass,
                                                          CanonicalNode& child) const
    {
        // Only properties owned by a declaring panel are filtered. Panel.ZIndex passes through.
        auto isPanelOwned = [this](const juce::String& key)
        {
            const auto owner = key.upToFirstOccurrenceOf(".", true, false);
            for (const auto& mapping : mappings.all())
            {
                for (const auto& declared : mapping.attachedProperties)
                {
                    if (declared.startsWith(owner))
                        return true;
                }
            }
            return false;
        };

        const auto keys = child.attachedProperties.getAllKeys();
        for (const auto& key : keys)
        {
            if (parent.attachedProperties.contains(key) || !isPanelOwned(key))
                continue;

            child.attachedProperties.remove(key);
            ++pass.report.skippedPropertyCount;
            pass.report.addIssue(IssueSeverity::info,
                                 childLabel + ": " + key + " dropped, " + parent.targetElement + " does not honour it");
        }
    }
}
