#pragma once

#include "Saekim/Public/Types.h"

namespace Saekim::Serialization
{
    // Failures carry the path of the offending value, e.g.
    // "scene.layers[0].nodes[1].children must be array".
    juce::Result parseScene(const juce::var& sceneVar, SceneModel& sceneOut);

    juce::Result parseSceneText(const juce::String& jsonText, SceneModel& sceneOut);

    juce::Result loadSceneFromFile(const juce::File& file, SceneModel& sceneOut);
}
