#include <doctest/doctest.h>
#include "orrery/scene/SceneBuilder.hpp"

#include <array>

using namespace orrery::scene;

TEST_CASE("NodeBuilder") {
    Scene scene{SceneConfig{}};
    SceneBuilder builder(scene);

    SUBCASE("Builds a named node under root") {
        const NodeHandle h = builder.spawn()
                                 .withName("crate")
                                 .withPosition({1.0f, 2.0f, 3.0f})
                                 .withScale(glm::vec3(0.5f))
                                 .withMesh(MeshHandle{4, 1})
                                 .build();
        const Node* node = scene.nodes().get(h);
        REQUIRE(node != nullptr);
        CHECK(node->name == "crate");
        CHECK(node->parent == scene.root());
        CHECK(node->transform.m_translation == glm::vec3(1.0f, 2.0f, 3.0f));
        CHECK(node->transform.m_scale == glm::vec3(0.5f));
        REQUIRE(node->kind() == NodeKind::StaticMesh);
        CHECK(node->as<StaticMeshNode>()->mesh == MeshHandle(4, 1));
    }

    SUBCASE("Nothing is created until build") {
        const size_t nodesBefore = scene.nodes().size();
        {
            NodeBuilder abandoned = builder.spawn();
            abandoned.withName("unused").withPointLight(glm::vec4(1.0f));
        }
        CHECK(scene.nodes().size() == nodesBefore);
        CHECK(scene.lights().empty());
    }

    SUBCASE("Light helpers allocate a light on build") {
        const NodeHandle h = builder.spawn().withSpotLight(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 0.5f, 2.0f).build();
        const auto* lightNode = scene.nodes().get(h)->as<LightNode>();
        REQUIRE(lightNode != nullptr);
        const Light* light = scene.getLight(lightNode->light);
        REQUIRE(light != nullptr);
        CHECK(light->type == LightType::Spot);
        CHECK(light->spotAngle == doctest::Approx(0.5f));
        CHECK(light->intensity == doctest::Approx(2.0f));
        CHECK(scene.lights().size() == 1);
    }

    SUBCASE("An existing light can be shared") {
        const LightHandle shared = scene.createLight(Light{});
        const NodeHandle a = builder.spawn().withLight(shared).build();
        const NodeHandle b = builder.spawn().withLight(shared).build();
        CHECK(scene.nodes().get(a)->as<LightNode>()->light == shared);
        CHECK(scene.nodes().get(b)->as<LightNode>()->light == shared);
        CHECK(scene.lights().size() == 1);
    }

    SUBCASE("The last payload wins") {
        const NodeHandle h = builder.spawn().withPointLight(glm::vec4(1.0f)).withMesh(MeshHandle{2, 1}).build();
        CHECK(scene.nodes().get(h)->kind() == NodeKind::StaticMesh);
        CHECK(scene.lights().empty());
    }

    SUBCASE("Parent and children") {
        const NodeHandle parent = builder.spawn().withName("parent").build();
        const NodeHandle loose = scene.createNode();
        const std::array<NodeHandle, 1> adopt{loose};

        const NodeHandle mid = builder.spawn().withParent(parent).withChildren(adopt).build();
        CHECK(scene.nodes().get(mid)->parent == parent);
        CHECK(scene.nodes().get(loose)->parent == mid);
        CHECK(scene.nodes().isAncestor(parent, loose));
    }

    SUBCASE("Skeletal mesh with an animation") {
        const NodeHandle h = builder.spawn()
                                 .withSkeletalMesh(SkeletalMeshHandle{1, 1}, Pose{PoseHandle{1, 1}, 12})
                                 .withAnimation(5, 2.0f, AnimationPlayMode::Loop)
                                 .build();
        const auto* skinned = scene.nodes().get(h)->as<SkeletalMeshNode>();
        REQUIRE(skinned != nullptr);
        CHECK(skinned->pose.boneCount == 12);
        REQUIRE(skinned->animation.has_value());
        CHECK(skinned->animation->clip == 5);
        CHECK(skinned->animation->mode == AnimationPlayMode::Loop);
        CHECK(skinned->animation->isPlaying());
    }

    SUBCASE("An animation on a static node is dropped") {
        const NodeHandle h = builder.spawn().withMesh(MeshHandle{1, 1}).withAnimation(1, 1.0f).build();
        CHECK(scene.nodes().contains(h));
        CHECK(scene.nodes().get(h)->kind() == NodeKind::StaticMesh);
    }
}

TEST_CASE("SceneBuilder::addLight") {
    Scene scene{SceneConfig{}};
    SceneBuilder builder(scene);

    LightDesc desc;
    desc.type = LightType::Directional;
    desc.color = {0.9f, 0.9f, 0.8f, 1.0f};
    desc.position = glm::vec3(0.0f, 10.0f, 0.0f);

    const NodeHandle h = builder.addLight(desc);
    const Node* node = scene.nodes().get(h);
    REQUIRE(node != nullptr);
    CHECK(node->parent == scene.root());
    CHECK(node->transform.m_translation == glm::vec3(0.0f, 10.0f, 0.0f));
    const Light* light = scene.getLight(node->as<LightNode>()->light);
    REQUIRE(light != nullptr);
    CHECK(light->type == LightType::Directional);
    CHECK(light->color == desc.color);

    const RenderView rv = scene.gatherRenderView();
    REQUIRE(rv.lights.size() == 1);
    CHECK(rv.lights[0].node == h);
}

TEST_CASE("Animator") {
    Scene scene{SceneConfig{}};
    SceneBuilder builder(scene);
    const NodeHandle skinned = builder.spawn().withSkeletalMesh(SkeletalMeshHandle{1, 1}).build();

    SUBCASE("Chained control") {
        Animator animator(scene, skinned);
        animator.playLooped(2, 1.0f).pause();
        CHECK_FALSE(animator.lastError().has_value());

        const auto& anim = *scene.nodes().get(skinned)->as<SkeletalMeshNode>()->animation;
        CHECK(anim.mode == AnimationPlayMode::Loop);
        CHECK(anim.status == AnimationStatus::Paused);

        animator.unpause().setLooping(false);
        CHECK(anim.isPlaying());
        CHECK(anim.mode == AnimationPlayMode::Once);

        animator.stop();
        CHECK(anim.status == AnimationStatus::Stopped);
        animator.play(7, 3.0f);
        CHECK(scene.nodes().get(skinned)->as<SkeletalMeshNode>()->animation->clip == 7);
    }

    SUBCASE("Failures are recorded, not thrown") {
        Animator animator(scene, skinned);
        animator.pause();
        CHECK(animator.lastError() == AnimationError::NoActiveAnimation);

        Animator onRoot(scene, scene.root());
        onRoot.play(0, 1.0f);
        CHECK(onRoot.lastError() == AnimationError::NotASkeletalMesh);

        Animator onNothing(scene, NodeHandle{});
        onNothing.stop();
        CHECK(onNothing.lastError() == AnimationError::InvalidNode);
    }
}
