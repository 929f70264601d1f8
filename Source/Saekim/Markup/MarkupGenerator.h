#pragma once

#include "Saekim/Core/LineBuilder.h"
#include "Saekim/Public/ExportTypes.h"
#include <optional>
#include <vector>

namespace Saekim::Markup
{
    struct DocumentInfo
    {
        juce::String title;
        std::optional<double> designWidth;
        std::optional<double> designHeight;
        std::vector<SceneResource> resources;
    };

    DocumentInfo makeDocumentInfo(const SceneModel& scene);

    struct NamespaceDeclaration
    {
        juce::String prefix;
        juce::String clrNamespace;
    };

    class MarkupGenerator
    {
    public:
        explicit MarkupGenerator(ExportOptions optionsIn);

        juce::String generateDocument(const std::vector<CanonicalNode>& nodes, const DocumentInfo& info) const;
        juce::String generateNode(const CanonicalNode& node, int indentLevel) const;

        // Empty prefix for the default Avalonia namespace, "local" for the export namespace.
        juce::String prefixFor(const juce::String& clrNamespace) const;

        // Extra using: declarations the tree needs, known prefixes first.
        std::vector<NamespaceDeclaration> collectNamespaces(const std::vector<CanonicalNode>& nodes) const;

        static bool needsCanvasWrap(const std::vector<CanonicalNode>& nodes);

    private:
        juce::String elementName(const CanonicalNode& node) const;
        void appendNode(Core::LineBuilder& out, const CanonicalNode& node, int level) const;
        void appendResources(Core::LineBuilder& out, const juce::String& rootElement, const DocumentInfo& info) const;

        ExportOptions options;
    };
}
