#include "bonk/core/Error.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/Transform.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using Catch::Matchers::WithinAbs;

namespace {

void CheckVector(const bonk::Vector2& actual, float x, float y, double tolerance = 1e-3) {
    CHECK_THAT(actual.x, WithinAbs(x, tolerance));
    CHECK_THAT(actual.y, WithinAbs(y, tolerance));
}

} // namespace

TEST_CASE("Transform without a parent reports its local pose as world pose", "[transform]") {
    auto object = bonk::GameObject::Create("Solo");
    auto& transform = object->GetTransform();
    transform.SetLocalPosition(12.0f, -4.0f);
    transform.SetLocalRotation(30.0f);
    transform.SetLocalScale(bonk::Vector2(2.0f, 3.0f));

    CheckVector(transform.GetWorldPosition(), 12.0f, -4.0f);
    CHECK_THAT(transform.GetWorldRotation(), WithinAbs(30.0f, 1e-4));
    CheckVector(transform.GetWorldScale(), 2.0f, 3.0f);
}

TEST_CASE("Transform composes the parent chain", "[transform]") {
    auto parent = bonk::GameObject::Create("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);

    parent->GetTransform().SetLocalPosition(100.0f, 0.0f);
    parent->GetTransform().SetLocalRotation(90.0f);
    child->GetTransform().SetLocalPosition(10.0f, 0.0f);
    child->GetTransform().SetLocalRotation(15.0f);

    CheckVector(child->GetTransform().GetWorldPosition(), 100.0f, 10.0f);
    CHECK_THAT(child->GetTransform().GetWorldRotation(), WithinAbs(105.0f, 1e-4));
}

TEST_CASE("Transform applies parent scale to child offsets", "[transform]") {
    auto parent = bonk::GameObject::Create("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);

    parent->GetTransform().SetLocalPosition(50.0f, 50.0f);
    parent->GetTransform().SetLocalScale(2.0f);
    child->GetTransform().SetLocalPosition(10.0f, 5.0f);
    child->GetTransform().SetLocalScale(1.5f);

    CheckVector(child->GetTransform().GetWorldPosition(), 70.0f, 60.0f);
    CheckVector(child->GetTransform().GetWorldScale(), 3.0f, 3.0f);
}

TEST_CASE("Transform world setters solve for the local value", "[transform]") {
    auto parent = bonk::GameObject::Create("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);

    parent->GetTransform().SetLocalPosition(50.0f, 50.0f);
    parent->GetTransform().SetLocalScale(2.0f);
    parent->GetTransform().SetLocalRotation(45.0f);

    child->GetTransform().SetWorldPosition(bonk::Vector2(80.0f, 20.0f));
    child->GetTransform().SetWorldRotation(10.0f);

    CheckVector(child->GetTransform().GetWorldPosition(), 80.0f, 20.0f);
    CHECK_THAT(child->GetTransform().GetLocalRotation(), WithinAbs(-35.0f, 1e-4));
    CHECK_THAT(child->GetTransform().GetWorldRotation(), WithinAbs(10.0f, 1e-4));
}

TEST_CASE("Transform point conversion round-trips", "[transform]") {
    auto object = bonk::GameObject::Create("Object");
    auto& transform = object->GetTransform();
    transform.SetLocalPosition(-20.0f, 7.0f);
    transform.SetLocalRotation(-60.0f);
    transform.SetLocalScale(bonk::Vector2(0.5f, 4.0f));

    const bonk::Vector2 world = transform.TransformPoint(bonk::Vector2(3.0f, -2.0f));
    CheckVector(transform.InverseTransformPoint(world), 3.0f, -2.0f);
}

TEST_CASE("Transform with zero scale inverts to the origin", "[transform]") {
    auto object = bonk::GameObject::Create("Flat");
    object->GetTransform().SetLocalScale(0.0f);

    CheckVector(object->GetTransform().InverseTransformPoint(bonk::Vector2(5.0f, 5.0f)), 0.0f, 0.0f);
}

TEST_CASE("Transform axes follow the world rotation", "[transform]") {
    auto object = bonk::GameObject::Create("Object");
    CheckVector(object->GetTransform().GetRight(), 1.0f, 0.0f);
    CheckVector(object->GetTransform().GetUp(), 0.0f, -1.0f);

    object->GetTransform().SetLocalRotation(90.0f);
    CheckVector(object->GetTransform().GetRight(), 0.0f, 1.0f);
    CheckVector(object->GetTransform().GetUp(), 1.0f, 0.0f);
}

TEST_CASE("Reparenting keeps the local pose", "[transform][hierarchy]") {
    auto parent = bonk::GameObject::Create("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->GetTransform().SetLocalPosition(100.0f, 100.0f);
    child->GetTransform().SetLocalPosition(5.0f, 5.0f);

    parent->AddChild(child);
    CheckVector(child->GetTransform().GetWorldPosition(), 105.0f, 105.0f);

    REQUIRE(child->SetParent(nullptr));
    CheckVector(child->GetTransform().GetLocalPosition(), 5.0f, 5.0f);
    CheckVector(child->GetTransform().GetWorldPosition(), 5.0f, 5.0f);
}

TEST_CASE("Reparenting into a descendant is rejected", "[transform][hierarchy]") {
    auto root = bonk::GameObject::Create("Root");
    auto middle = bonk::GameObject::Create("Middle");
    auto leaf = bonk::GameObject::Create("Leaf");
    root->AddChild(middle);
    middle->AddChild(leaf);

    CHECK_THROWS_AS(root->SetParent(leaf), bonk::core::CyclicHierarchyError);
    CHECK_THROWS_AS(middle->SetParent(middle), bonk::core::CyclicHierarchyError);

    // The failed moves left the tree untouched.
    CHECK(root->GetParentPtr() == nullptr);
    CHECK(leaf->GetParentPtr() == middle.get());
    CHECK(middle->GetParentPtr() == root.get());
}

TEST_CASE("Transform Reset restores identity", "[transform]") {
    bonk::Transform transform;
    transform.SetLocalPosition(1.0f, 2.0f);
    transform.SetLocalRotation(3.0f);
    transform.SetLocalScale(4.0f);
    transform.SetZIndex(5);

    transform.Reset();

    CheckVector(transform.GetLocalPosition(), 0.0f, 0.0f);
    CHECK(transform.GetLocalRotation() == 0.0f);
    CheckVector(transform.GetLocalScale(), 1.0f, 1.0f);
    CHECK(transform.GetZIndex() == 0);
}
