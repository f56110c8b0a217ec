#include "orrery/engine.hpp"

#include <glm/gtc/constants.hpp>
#include <filesystem>
#include <string>

using namespace orrery;
using namespace orrery::scene;

namespace {
    constexpr float kFrameTime = 1.0f / 60.0f;
    constexpr int kFrameCount = 240;

    struct Bodies {
        NodeHandle sun;
        NodeHandle planetPivot;
        NodeHandle planet;
        NodeHandle moonPivot;
        NodeHandle moon;
        NodeHandle rig;
    };

    Bodies buildSystem(Scene& scene) {
        SceneBuilder builder(scene);
        Bodies b{};

        builder.addLight(LightDesc{.type = LightType::Directional,
                                   .color = {1.0f, 0.95f, 0.9f, 1.0f},
                                   .rotation = glm::angleAxis(glm::half_pi<float>(), glm::vec3(1.0f, 0.0f, 0.0f))});

        b.sun = builder.spawn().withName("sun").withMesh(MeshHandle{1, 1}).withScale(glm::vec3(2.0f)).build();
        builder.spawn().withName("sun light").withParent(b.sun).withPointLight({1.0f, 0.8f, 0.4f, 1.0f}, 4.0f).build();

        b.planetPivot = builder.spawn().withName("planet pivot").withParent(b.sun).build();
        b.planet = builder.spawn()
                       .withName("planet")
                       .withParent(b.planetPivot)
                       .withPosition({4.0f, 0.0f, 0.0f})
                       .withMesh(MeshHandle{2, 1})
                       .build();

        b.moonPivot = builder.spawn().withName("moon pivot").withParent(b.planet).build();
        b.moon = builder.spawn()
                     .withName("moon")
                     .withParent(b.moonPivot)
                     .withPosition({1.5f, 0.0f, 0.0f})
                     .withScale(glm::vec3(0.3f))
                     .withMesh(MeshHandle{3, 1})
                     .build();

        b.rig = builder.spawn()
                    .withName("mechanism")
                    .withPosition({0.0f, -3.0f, 0.0f})
                    .withSkeletalMesh(SkeletalMeshHandle{1, 1}, Pose{PoseHandle{1, 1}, 24})
                    .withAnimation(0, 2.0f, AnimationPlayMode::PingPong)
                    .build();
        return b;
    }

    std::optional<geometry::BoundingBox> unitBounds(NodeHandle, const Node&) {
        return geometry::BoundingBox{glm::vec3(-0.5f), glm::vec3(0.5f)};
    }
}

int main(int argc, char** argv) {
    Log::init();

    const std::filesystem::path configPath = argc > 1 ? argv[1] : "orrery_scene.ini";
    core::CVarSystem::loadFromIni(configPath);

    Scene scene;
    scene.onResize(1280, 720);
    const Bodies bodies = buildSystem(scene);
    Log::info("Built scene with {} nodes and {} lights", scene.nodes().size(), scene.lights().size());

    scene.setCameraMode(CameraMode::Orbit);
    scene.zoomOrbitCamera(8.0f);
    scene.rotateOrbitCamera(0.0f, 0.4f);

    for (int frame = 0; frame < kFrameCount; ++frame) {
        ORRERY_PROFILE_FRAME_MARK();

        scene.nodes().get(bodies.planetPivot)->transform.rotate(0.8f * kFrameTime, glm::vec3(0.0f, 1.0f, 0.0f));
        scene.nodes().get(bodies.moonPivot)->transform.rotate(3.0f * kFrameTime, glm::vec3(0.0f, 1.0f, 0.0f));
        scene.rotateOrbitCamera(0.25f * kFrameTime, 0.0f);
        scene.update(kFrameTime, CameraInput{});

        if (frame % 60 == 0) {
            const RenderView view = scene.gatherRenderView(unitBounds);
            const glm::vec3 moon = glm::vec3((*scene.worldMatrix(bodies.moon))[3]);
            Log::info("frame {:3}: {} drawables, {} culled, {} lights, moon at ({:.2f}, {:.2f}, {:.2f})",
                      frame, view.drawables.size(), view.culledCount, view.lights.size(), moon.x, moon.y, moon.z);
        }
    }

    const auto* rig = scene.nodes().get(bodies.rig)->as<SkeletalMeshNode>();
    if (rig != nullptr && rig->animation) {
        Log::info("mechanism clip at t={:.2f} ({})", rig->animation->time, toString(rig->animation->status));
    }

    // Leaving the camera in free mode and walking it back shows the fly controls.
    scene.setCameraMode(CameraMode::Free);
    CameraInput back;
    back.move = {0.0f, 0.0f, -1.0f};
    scene.update(1.0f, back);
    Log::info("free camera backed off to distance {:.2f}", glm::length(scene.camera().position()));

    scene.destroyNode(bodies.planetPivot);
    Log::info("After removing the planet: {} nodes", scene.nodes().size());

    core::CVarSystem::saveToIni(configPath);
    Log::shutdown();
    return 0;
}
