#include <juce_core/juce_core.h>

#include "Saekim/Core/Identifiers.h"
#include "Saekim/Core/LineBuilder.h"
#include "Saekim/Mapping/ControlMappings.h"
#include "Saekim/Mapping/FrameworkAliases.h"

#include <functional>
#include <iostream>
#include <set>
#include <vector>

namespace
{
    juce::Result testMappingRegistryEntriesAreUnique()
    {
        const auto& registry = Saekim::Mapping::defaultMappingRegistry();
        if (registry.all().size() < 55)
            return juce::Result::fail("Default registry is missing mappings: " + juce::String(static_cast<int>(registry.all().size())));

        std::set<juce::String> sourceTypes;
        for (const auto& mapping : registry.all())
        {
            if (mapping.targetElement.trim().isEmpty())
                return juce::Result::fail("Mapping has empty target element: " + mapping.sourceType);

            if (!sourceTypes.insert(mapping.sourceType).second)
                return juce::Result::fail("Duplicate source type: " + mapping.sourceType);

            if (registry.findBySourceType(mapping.sourceType) != &mapping)
                return juce::Result::fail("Lookup does not return the registered mapping: " + mapping.sourceType);

            for (const auto& rule : mapping.rules)
            {
                if (rule.source.isEmpty() || rule.target.isEmpty())
                    return juce::Result::fail("Mapping has an incomplete rule: " + mapping.sourceType);
            }
        }

        if (registry.findBySourceType("ui-does-not-exist") != nullptr)
            return juce::Result::fail("Unknown source type resolved to a mapping");

        return juce::Result::ok();
    }

    juce::Result testMappingRegistryRejectsInvalidEntries()
    {
        auto registry = Saekim::Mapping::makeDefaultMappingRegistry();
        const auto before = registry.all().size();

        Saekim::Mapping::ControlMapping duplicate;
        duplicate.sourceType = "ui-button";
        duplicate.targetElement = "Button";
        if (registry.registerMapping(duplicate))
            return juce::Result::fail("Duplicate source type was accepted");

        Saekim::Mapping::ControlMapping noTarget;
        noTarget.sourceType = "ui-orphan";
        if (registry.registerMapping(noTarget))
            return juce::Result::fail("Mapping without target element was accepted");

        Saekim::Mapping::ControlMapping custom;
        custom.sourceType = "  ui-gauge  ";
        custom.targetElement = "Gauge";
        custom.targetNamespace = "";
        if (!registry.registerMapping(custom))
            return juce::Result::fail("Valid custom mapping was rejected");

        if (registry.all().size() != before + 1)
            return juce::Result::fail("Registry size changed unexpectedly");

        const auto* gauge = registry.findBySourceType("ui-gauge");
        if (gauge == nullptr || gauge->targetNamespace != "Avalonia.Controls")
            return juce::Result::fail("Custom mapping was not trimmed or namespace not defaulted");

        return juce::Result::ok();
    }

    juce::Result testMappingCategoryListing()
    {
        const auto& registry = Saekim::Mapping::defaultMappingRegistry();
        const auto layouts = registry.findByCategory("layout-");
        if (layouts.size() != 7)
            return juce::Result::fail("Expected 7 layout mappings, got " + juce::String(static_cast<int>(layouts.size())));

        for (const auto* mapping : layouts)
        {
            if (!mapping->sourceType.startsWith("layout-") || mapping->contentProperty != "Children")
                return juce::Result::fail("Unexpected layout mapping: " + mapping->sourceType);
        }

        const auto* first = registry.findByTargetElement("TextBox");
        if (first == nullptr || first->sourceType != "ui-textbox")
            return juce::Result::fail("TextBox should resolve to the first registered mapping");

        return juce::Result::ok();
    }

    juce::Result testFrameworkAliases()
    {
        const auto& aliases = Saekim::Mapping::defaultFrameworkAliasRegistry();
        const auto& mappings = Saekim::Mapping::defaultMappingRegistry();

        const auto* button = aliases.findComponent("button");
        if (button == nullptr || button->targetElement != "Button" || button->preferredSourceType != "ui-button")
            return juce::Result::fail("Case-insensitive alias lookup failed for button");

        const auto* card = aliases.findComponent("Card");
        if (card == nullptr || card->targetElement != "Border" || card->styleClass != "AsciiCard")
            return juce::Result::fail("Card alias should map to Border with AsciiCard class");

        for (const auto& alias : aliases.components())
        {
            if (alias.preferredSourceType.isNotEmpty() && mappings.findBySourceType(alias.preferredSourceType) == nullptr)
                return juce::Result::fail("Alias points at unknown mapping: " + alias.componentType);
        }

        if (aliases.translatePropertyName("placeholder") != "Watermark")
            return juce::Result::fail("placeholder should translate to Watermark");
        if (aliases.translatePropertyName("tooltip") != "ToolTip.Tip")
            return juce::Result::fail("tooltip should translate to ToolTip.Tip");
        if (aliases.translatePropertyName("borderGlow") != "BorderGlow")
            return juce::Result::fail("Unknown property names should be PascalCased");

        auto copy = Saekim::Mapping::makeDefaultFrameworkAliasRegistry();
        Saekim::Mapping::ComponentAlias duplicate;
        duplicate.componentType = "BUTTON";
        duplicate.targetElement = "Button";
        if (copy.registerAlias(duplicate))
            return juce::Result::fail("Duplicate alias differing only by case was accepted");

        return juce::Result::ok();
    }

    juce::Result testIdentifierRepair()
    {
        if (Saekim::Core::sanitizeIdentifier("My Button") != "My_Button")
            return juce::Result::fail("Spaces should become underscores");
        if (Saekim::Core::sanitizeIdentifier("9lives") != "_9lives")
            return juce::Result::fail("Leading digit should be prefixed");
        if (Saekim::Core::sanitizeIdentifier("---") != "_generated")
            return juce::Result::fail("Unusable identifier should fall back");
        if (Saekim::Core::sanitizeNamespace("My App..Views", "Fallback") != "My_App.Views")
            return juce::Result::fail("Namespace segments were not repaired");

        std::set<juce::String> used;
        const auto first = Saekim::Core::makeUniqueName("okButton", used);
        const auto second = Saekim::Core::makeUniqueName("okButton", used);
        const auto third = Saekim::Core::makeUniqueName("okButton", used);
        if (first != "okButton" || second != "okButton2" || third != "okButton3")
            return juce::Result::fail("Unique names are not suffixed in order: " + first + ", " + second + ", " + third);

        return juce::Result::ok();
    }

    juce::Result testLineBuilderIndentation()
    {
        Saekim::Core::LineBuilder out("  ");
        out.add("<Root>");
        out.indent();
        out.add("<Child />");
        out.addBlank();
        out.addBlock("<A>\n  <B />\n</A>");
        out.outdent();
        out.add("</Root>");
        out.appendToLast("!");

        const juce::String expected = "<Root>\n"
                                      "  <Child />\n"
                                      "\n"
                                      "  <A>\n"
                                      "    <B />\n"
                                      "  </A>\n"
                                      "</Root>!";
        if (out.toString() != expected)
            return juce::Result::fail("Unexpected builder output:\n" + out.toString());

        if (Saekim::Core::LineBuilder::makeIndentUnit(2, false) != "  "
            || Saekim::Core::LineBuilder::makeIndentUnit(4, true) != "\t")
            return juce::Result::fail("Indent unit construction is wrong");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Mapping registry entries are unique", testMappingRegistryEntriesAreUnique },
        { "Mapping registry rejects invalid entries", testMappingRegistryRejectsInvalidEntries },
        { "Mapping category listing", testMappingCategoryListing },
        { "Framework aliases", testFrameworkAliases },
        { "Identifier repair", testIdentifierRepair },
        { "Line builder indentation", testLineBuilderIndentation }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Saekim mapping smoke passed." << std::endl;
    return 0;
}
