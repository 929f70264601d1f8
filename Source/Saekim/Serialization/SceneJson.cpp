#include "Saekim/Serialization/SceneJson.h"

#include <cmath>
#include <initializer_list>
#include <utility>

namespace
{
    using namespace Saekim;

    juce::String indexed(const juce::String& context, const char* key, int index)
    {
        return context + "." + key + "[" + juce::String(index) + "]";
    }

    // First of the given keys that is present; empty identifier when none is.
    juce::Identifier firstPresentKey(const juce::NamedValueSet& props, std::initializer_list<const char*> keys)
    {
        for (const auto* key : keys)
        {
            if (props.contains(key))
                return key;
        }

        return {};
    }

    juce::Result readOptionalString(const juce::NamedValueSet& props,
                                    const juce::Identifier& key,
                                    const juce::String& context,
                                    juce::String& valueOut)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (value.isVoid())
            return juce::Result::ok();
        if (!value.isString())
            return juce::Result::fail(context + "." + key.toString() + " must be string");

        valueOut = value.toString();
        return juce::Result::ok();
    }

    juce::Result readOptionalNumber(const juce::NamedValueSet& props,
                                    const juce::Identifier& key,
                                    const juce::String& context,
                                    std::optional<double>& valueOut)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (value.isVoid())
            return juce::Result::ok();
        if (!isNumericVar(value))
            return juce::Result::fail(context + "." + key.toString() + " must be numeric");

        const auto number = static_cast<double>(value);
        if (!std::isfinite(number))
            return juce::Result::fail(context + "." + key.toString() + " must be finite");

        valueOut = number;
        return juce::Result::ok();
    }

    juce::Result parseNode(const juce::var& nodeVar, const juce::String& context, int depth, SceneNode& nodeOut);

    juce::Result parseNodeArray(const juce::var& arrayVar,
                                const juce::String& context,
                                const char* key,
                                int depth,
                                std::vector<SceneNode>& nodesOut)
    {
        const auto* items = arrayVar.getArray();
        if (items == nullptr)
            return juce::Result::fail(context + "." + key + " must be array");

        nodesOut.reserve(static_cast<size_t>(items->size()));
        for (int i = 0; i < items->size(); ++i)
        {
            SceneNode node;
            const auto result = parseNode(items->getReference(i), indexed(context, key, i), depth, node);
            if (result.failed())
                return result;
            nodesOut.push_back(std::move(node));
        }

        return juce::Result::ok();
    }

    juce::Result parseNode(const juce::var& nodeVar, const juce::String& context, int depth, SceneNode& nodeOut)
    {
        if (depth > kMaxTreeDepth + 1)
            return juce::Result::fail(context + " is nested deeper than " + juce::String(kMaxTreeDepth) + " levels");

        const auto* object = nodeVar.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + " must be object");

        const auto& props = object->getProperties();
        SceneNode node;

        const auto typeKey = firstPresentKey(props, { "type", "uiComponentType" });
        if (typeKey.isValid())
        {
            const auto typeResult = readOptionalString(props, typeKey, context, node.type);
            if (typeResult.failed())
                return typeResult;
        }

        const auto targetKey = firstPresentKey(props, { "targetType", "avaloniaType" });
        if (targetKey.isValid())
        {
            const auto targetResult = readOptionalString(props, targetKey, context, node.targetType);
            if (targetResult.failed())
                return targetResult;
        }

        if (node.type.trim().isEmpty() && node.targetType.trim().isEmpty())
            return juce::Result::fail(context + " requires type or targetType");

        if (node.type.trim().isEmpty())
            node.type = node.targetType;

        for (const auto& field : { std::make_pair("targetNamespace", &node.targetNamespace),
                                   std::make_pair("name", &node.name) })
        {
            const auto result = readOptionalString(props, field.first, context, *field.second);
            if (result.failed())
                return result;
        }

        const auto xResult = readOptionalNumber(props, "x", context, node.x);
        if (xResult.failed())
            return xResult;

        const auto yResult = readOptionalNumber(props, "y", context, node.y);
        if (yResult.failed())
            return yResult;

        const auto propertiesKey = firstPresentKey(props, { "properties", "uiProperties" });
        if (propertiesKey.isValid() && !props[propertiesKey].isVoid())
        {
            const auto* bag = props[propertiesKey].getDynamicObject();
            if (bag == nullptr)
                return juce::Result::fail(context + "." + propertiesKey.toString() + " must be object");

            node.properties = bag->getProperties();
        }

        if (props.contains("children") && !props["children"].isVoid())
        {
            const auto childrenResult = parseNodeArray(props["children"], context, "children", depth + 1, node.children);
            if (childrenResult.failed())
                return childrenResult;
        }

        nodeOut = std::move(node);
        return juce::Result::ok();
    }

    juce::Result parseLayer(const juce::var& layerVar, const juce::String& context, SceneLayer& layerOut)
    {
        const auto* object = layerVar.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + " must be object");

        const auto& props = object->getProperties();
        SceneLayer layer;

        const auto nameResult = readOptionalString(props, "name", context, layer.name);
        if (nameResult.failed())
            return nameResult;

        if (props.contains("visible"))
        {
            const auto& visible = props["visible"];
            if (!visible.isBool())
                return juce::Result::fail(context + ".visible must be bool");
            layer.visible = static_cast<bool>(visible);
        }

        const auto nodesKey = firstPresentKey(props, { "nodes", "objects" });
        if (nodesKey.isValid())
        {
            const auto nodesResult = parseNodeArray(props[nodesKey],
                                                    context,
                                                    nodesKey.toString().toRawUTF8(),
                                                    1,
                                                    layer.nodes);
            if (nodesResult.failed())
                return nodesResult;
        }

        layerOut = std::move(layer);
        return juce::Result::ok();
    }

    juce::Result parseResources(const juce::var& resourcesVar, std::vector<SceneResource>& resourcesOut)
    {
        if (resourcesVar.isVoid())
            return juce::Result::ok();

        if (const auto* object = resourcesVar.getDynamicObject())
        {
            for (const auto& entry : object->getProperties())
                resourcesOut.push_back({ entry.name.toString(), entry.value });
            return juce::Result::ok();
        }

        const auto* items = resourcesVar.getArray();
        if (items == nullptr)
            return juce::Result::fail("scene.resources must be object or array");

        for (int i = 0; i < items->size(); ++i)
        {
            const auto context = "scene.resources[" + juce::String(i) + "]";
            const auto* entry = items->getReference(i).getDynamicObject();
            if (entry == nullptr)
                return juce::Result::fail(context + " must be object");

            const auto& props = entry->getProperties();
            const auto keyName = firstPresentKey(props, { "key", "name" });
            if (!keyName.isValid() || props[keyName].toString().trim().isEmpty())
                return juce::Result::fail(context + " requires key");

            resourcesOut.push_back({ props[keyName].toString().trim(), props["value"] });
        }

        return juce::Result::ok();
    }
}

namespace Saekim::Serialization
{
    juce::Result parseScene(const juce::var& sceneVar, SceneModel& sceneOut)
    {
        const auto* root = sceneVar.getDynamicObject();
        if (root == nullptr)
            return juce::Result::fail("scene must be object");

        const auto& props = root->getProperties();
        const juce::String context("scene");
        SceneModel scene;

        const auto titleResult = readOptionalString(props, "title", context, scene.title);
        if (titleResult.failed())
            return titleResult;

        const auto widthResult = readOptionalNumber(props, "width", context, scene.width);
        if (widthResult.failed())
            return widthResult;

        const auto heightResult = readOptionalNumber(props, "height", context, scene.height);
        if (heightResult.failed())
            return heightResult;

        if (props.contains("layers") && !props["layers"].isVoid())
        {
            const auto* layers = props["layers"].getArray();
            if (layers == nullptr)
                return juce::Result::fail("scene.layers must be array");

            for (int i = 0; i < layers->size(); ++i)
            {
                SceneLayer layer;
                const auto layerResult = parseLayer(layers->getReference(i), indexed(context, "layers", i), layer);
                if (layerResult.failed())
                    return layerResult;
                scene.layers.push_back(std::move(layer));
            }
        }

        const auto nodesKey = firstPresentKey(props, { "nodes", "objects", "components" });
        if (nodesKey.isValid())
        {
            const auto nodesResult = parseNodeArray(props[nodesKey],
                                                    context,
                                                    nodesKey.toString().toRawUTF8(),
                                                    1,
                                                    scene.nodes);
            if (nodesResult.failed())
                return nodesResult;
        }

        if (props.contains("resources"))
        {
            const auto resourcesResult = parseResources(props["resources"], scene.resources);
            if (resourcesResult.failed())
                return resourcesResult;
        }

        sceneOut = std::move(scene);
        return juce::Result::ok();
    }

    juce::Result parseSceneText(const juce::String& jsonText, SceneModel& sceneOut)
    {
        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(jsonText, rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        return parseScene(rootVar, sceneOut);
    }

    juce::Result loadSceneFromFile(const juce::File& file, SceneModel& sceneOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        return parseSceneText(file.loadFileAsString(), sceneOut);
    }
}
