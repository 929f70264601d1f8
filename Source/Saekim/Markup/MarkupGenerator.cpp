#include "Saekim/Markup/MarkupGenerator.h"

#include "Saekim/Convert/ValueConverters.h"
#include "Saekim/Core/Identifiers.h"
#include "Saekim/Core/XmlText.h"

namespace
{
    using Saekim::CanonicalNode;
    using Saekim::Markup::NamespaceDeclaration;

    struct KnownNamespace
    {
        const char* clrNamespace;
        const char* prefix;
    };

    constexpr KnownNamespace kKnownNamespaces[] = {
        { "Avalonia.Controls.Primitives", "primitives" },
        { "Avalonia.Controls.Shapes", "shapes" },
        { "Avalonia.Media", "media" },
        { "Avalonia.Layout", "layout" },
        { "Avalonia.Data", "data" },
        { "Avalonia.Xaml.Interactivity", "interactivity" }
    };

    constexpr const char* kDefaultClrNamespace = "Avalonia.Controls";
    constexpr double kDefaultDesignWidth = 800.0;
    constexpr double kDefaultDesignHeight = 600.0;

    juce::String escapeComment(const juce::String& text)
    {
        return text.replace("--", "- -");
    }

    void collectNamespacesRecursive(const std::vector<CanonicalNode>& nodes, juce::StringArray& seen)
    {
        for (const auto& node : nodes)
        {
            seen.addIfNotAlreadyThere(node.targetNamespace.trim());
            collectNamespacesRecursive(node.children, seen);
        }
    }

    std::vector<std::pair<juce::String, juce::String>> orderedAttributes(const CanonicalNode& node, bool emitClasses)
    {
        std::vector<std::pair<juce::String, juce::String>> attributes;

        if (node.name.isNotEmpty())
            attributes.emplace_back("x:Name", node.name);
        if (emitClasses && node.styleClass.isNotEmpty())
            attributes.emplace_back("Classes", node.styleClass);

        for (const auto& key : node.attributes.getAllKeys())
            attributes.emplace_back(key, node.attributes[key]);
        for (const auto& key : node.attachedProperties.getAllKeys())
            attributes.emplace_back(key, node.attachedProperties[key]);

        return attributes;
    }
}

namespace Saekim::Markup
{
    DocumentInfo makeDocumentInfo(const SceneModel& scene)
    {
        DocumentInfo info;
        info.title = scene.title;
        info.designWidth = scene.width;
        info.designHeight = scene.height;
        info.resources = scene.resources;
        return info;
    }

    MarkupGenerator::MarkupGenerator(ExportOptions optionsIn)
        : options(std::move(optionsIn))
    {
    }

    juce::String MarkupGenerator::prefixFor(const juce::String& clrNamespace) const
    {
        const auto trimmed = clrNamespace.trim();
        if (trimmed.isEmpty() || trimmed == kDefaultClrNamespace)
            return {};
        if (trimmed == options.rootNamespace)
            return "local";

        for (const auto& known : kKnownNamespaces)
        {
            if (trimmed == known.clrNamespace)
                return known.prefix;
        }

        return Core::sanitizeIdentifier(trimmed.fromLastOccurrenceOf(".", false, false).toLowerCase(), "ns");
    }

    std::vector<NamespaceDeclaration> MarkupGenerator::collectNamespaces(const std::vector<CanonicalNode>& nodes) const
    {
        juce::StringArray seen;
        collectNamespacesRecursive(nodes, seen);

        std::vector<NamespaceDeclaration> declarations;
        juce::StringArray usedPrefixes { "x", "d", "mc", "local" };

        for (const auto& known : kKnownNamespaces)
        {
            if (seen.contains(known.clrNamespace))
            {
                declarations.push_back({ known.prefix, known.clrNamespace });
                usedPrefixes.add(known.prefix);
            }
        }

        for (const auto& clrNamespace : seen)
        {
            const auto prefix = prefixFor(clrNamespace);
            if (prefix.isEmpty() || usedPrefixes.contains(prefix))
                continue;

            declarations.push_back({ prefix, clrNamespace });
            usedPrefixes.add(prefix);
        }

        return declarations;
    }

    bool MarkupGenerator::needsCanvasWrap(const std::vector<CanonicalNode>& nodes)
    {
        for (const auto& node : nodes)
        {
            const auto keys = node.attachedProperties.getAllKeys();
            if (keys.contains("Canvas.Left") || keys.contains("Canvas.Top"))
                return true;
        }

        return false;
    }

    juce::String MarkupGenerator::elementName(const CanonicalNode& node) const
    {
        const auto prefix = prefixFor(node.targetNamespace);
        return prefix.isEmpty() ? node.targetType : prefix + ":" + node.targetType;
    }

    juce::String MarkupGenerator::generateNode(const CanonicalNode& node, int indentLevel) const
    {
        Core::LineBuilder out(options.indentUnit());
        appendNode(out, node, indentLevel);
        return out.toString();
    }

    void MarkupGenerator::appendNode(Core::LineBuilder& out, const CanonicalNode& node, int level) const
    {
        if (!node.supported && options.includeComments)
            out.addAt(level, "<!-- Unmapped component: " + escapeComment(node.sourceType) + " -->");

        const auto tag = elementName(node);
        const auto attributes = orderedAttributes(node, options.generateTheme);
        const auto hasBody = node.hasContent();

        if (!hasBody)
        {
            if (attributes.empty())
            {
                out.addAt(level, "<" + tag + " />");
                return;
            }

            if (attributes.size() <= 2)
            {
                juce::String line = "<" + tag;
                for (const auto& [name, value] : attributes)
                    line << " " << Core::xmlAttribute(name, value);
                out.addAt(level, line + " />");
                return;
            }
        }

        if (attributes.empty())
        {
            out.addAt(level, "<" + tag + ">");
        }
        else
        {
            out.addAt(level, "<" + tag);
            for (const auto& [name, value] : attributes)
                out.addAt(level + 1, Core::xmlAttribute(name, value));
            out.appendToLast(hasBody ? ">" : " />");
        }

        if (!hasBody)
            return;

        for (const auto& key : node.nestedProperties.getAllKeys())
        {
            out.addAt(level + 1, "<" + tag + "." + key + ">");
            out.addBlockAt(level + 2, node.nestedProperties[key]);
            out.addAt(level + 1, "</" + tag + "." + key + ">");
        }

        for (const auto& child : node.children)
            appendNode(out, child, level + 1);

        if (node.children.empty() && node.textContent.has_value())
        {
            const auto text = Core::escapeMarkupValue(*node.textContent);
            if (node.contentProperty.isNotEmpty() && node.contentProperty != "Content")
            {
                out.addAt(level + 1, "<" + tag + "." + node.contentProperty + ">");
                out.addBlockAt(level + 2, text);
                out.addAt(level + 1, "</" + tag + "." + node.contentProperty + ">");
            }
            else
            {
                out.addBlockAt(level + 1, text);
            }
        }

        out.addAt(level, "</" + tag + ">");
    }

    void MarkupGenerator::appendResources(Core::LineBuilder& out, const juce::String& rootElement, const DocumentInfo& info) const
    {
        Core::LineBuilder resources(options.indentUnit());
        Core::LineBuilder styles(options.indentUnit());

        for (const auto& resource : info.resources)
        {
            const auto key = Core::escapeXml(resource.key);
            const auto& value = resource.value;

            if (value.isString())
            {
                const auto text = value.toString();
                if (text.startsWithChar('#'))
                    resources.addAt(2, "<SolidColorBrush x:Key=\"" + key + "\" Color=\"" + Core::escapeXml(text) + "\" />");
                else
                    resources.addAt(2, "<x:String x:Key=\"" + key + "\">" + Core::escapeXml(text) + "</x:String>");
                continue;
            }

            if (isNumericVar(value))
            {
                resources.addAt(2, "<x:Double x:Key=\"" + key + "\">" + Convert::formatNumber(static_cast<double>(value)) + "</x:Double>");
                continue;
            }

            if (auto* object = value.getDynamicObject())
            {
                const auto& props = object->getProperties();
                if (props["type"].toString() != "style")
                {
                    DBG("[Saekim] Resource skipped (unsupported object): " + resource.key);
                    continue;
                }

                auto selector = props["selector"].toString().trim();
                if (selector.isEmpty())
                    selector = resource.key;

                styles.addAt(2, "<Style Selector=\"" + Core::escapeXml(selector) + "\">");
                if (auto* setters = props["setters"].getDynamicObject())
                {
                    for (const auto& setter : setters->getProperties())
                    {
                        styles.addAt(3, "<Setter Property=\"" + Core::escapeXml(setter.name.toString())
                                            + "\" Value=\"" + Core::escapeMarkupValue(Convert::varToText(setter.value)) + "\" />");
                    }
                }
                styles.addAt(2, "</Style>");
                continue;
            }

            DBG("[Saekim] Resource skipped (unsupported value): " + resource.key);
        }

        if (!resources.isEmpty())
        {
            out.addAt(1, "<" + rootElement + ".Resources>");
            out.addBlock(resources.toString());
            out.addAt(1, "</" + rootElement + ".Resources>");
            out.addBlank();
        }

        if (!styles.isEmpty())
        {
            out.addAt(1, "<" + rootElement + ".Styles>");
            out.addBlock(styles.toString());
            out.addAt(1, "</" + rootElement + ".Styles>");
            out.addBlank();
        }
    }

    juce::String MarkupGenerator::generateDocument(const std::vector<CanonicalNode>& nodes, const DocumentInfo& info) const
    {
        const auto rootElement = rootKindToElement(options.rootKind);
        const auto designable = options.rootKind == RootKind::window || options.rootKind == RootKind::userControl;

        Core::LineBuilder out(options.indentUnit());
        out.add("<?xml version=\"1.0\" encoding=\"utf-8\"?>");
        out.add("<" + rootElement);
        out.addAt(1, "xmlns=\"https://github.com/avaloniaui\"");
        out.addAt(1, "xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"");

        if (options.includeDesignTimeData)
        {
            out.addAt(1, "xmlns:d=\"http://schemas.microsoft.com/expression/blend/2008\"");
            out.addAt(1, "xmlns:mc=\"http://schemas.openxmlformats.org/markup-compatibility/2006\"");
            out.addAt(1, "mc:Ignorable=\"d\"");
        }

        out.addAt(1, "xmlns:local=\"clr-namespace:" + options.rootNamespace + "\"");

        for (const auto& declaration : collectNamespaces(nodes))
            out.addAt(1, "xmlns:" + declaration.prefix + "=\"using:" + declaration.clrNamespace + "\"");

        if (designable && options.includeDesignTimeData)
        {
            const auto width = Convert::formatNumber(info.designWidth.value_or(kDefaultDesignWidth));
            const auto height = Convert::formatNumber(info.designHeight.value_or(kDefaultDesignHeight));
            out.addAt(1, "d:DesignWidth=\"" + width + "\" d:DesignHeight=\"" + height + "\"");
        }

        out.addAt(1, "x:Class=\"" + options.rootNamespace + "." + options.className + "\"");

        if (options.rootKind == RootKind::window)
        {
            const auto title = info.title.trim().isNotEmpty() ? info.title.trim() : options.className;
            out.addAt(1, Core::xmlAttribute("Title", title));
        }

        out.appendToLast(">");
        out.addBlank();

        if (options.includeStyles && !info.resources.empty())
            appendResources(out, rootElement, info);

        if (needsCanvasWrap(nodes))
        {
            out.addAt(1, "<Canvas>");
            for (const auto& node : nodes)
                appendNode(out, node, 2);
            out.addAt(1, "</Canvas>");
        }
        else
        {
            for (const auto& node : nodes)
                appendNode(out, node, 1);
        }

        if (!nodes.empty())
            out.addBlank();

        out.add("</" + rootElement + ">");
        return out.toString() + "\n";
    }
}
