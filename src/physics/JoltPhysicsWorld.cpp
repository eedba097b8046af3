#include "bonk/physics/JoltPhysicsWorld.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"

#include <Jolt/Core/Factory.h>
#include <Jolt/Geometry/AABox.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyInterface.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseQuery.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/ContactListener.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/ConvexHullShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/RegisterTypes.h>

#include <fmt/format.h>
#include <glm/common.hpp>
#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bonk::physics {

namespace {

// Half thickness of every shape along the locked Z axis, in meters.
constexpr float kHalfDepth = 0.5f;
// Stand-in box used until a collider is attached, in pixels.
constexpr float kPlaceholderSize = 1.0f;

std::mutex g_runtimeMutex;
int g_runtimeUsers = 0;
std::unique_ptr<JPH::Factory> g_factory;

void JoltTraceImpl(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    core::Logger::Debug("[Jolt] {}", static_cast<const char*>(buffer));
}

#ifdef JPH_ENABLE_ASSERTS
bool JoltAssertFailedImpl(const char* expression,
                          const char* message,
                          const char* file,
                          JPH::uint line) {
    core::Logger::Error("[Jolt][Assert] {}:{}: ({}) {}",
                        file ? file : "<unknown>",
                        static_cast<unsigned>(line),
                        expression ? expression : "<expr>",
                        message ? message : "");
    return false;
}
#endif

// Jolt keeps its allocator, factory and type registry in globals shared by every world.
void AcquireJoltRuntime() {
    std::lock_guard<std::mutex> lock(g_runtimeMutex);
    if (g_runtimeUsers++ > 0) {
        return;
    }
    JPH::RegisterDefaultAllocator();
    JPH::Trace = JoltTraceImpl;
#ifdef JPH_ENABLE_ASSERTS
    JPH::AssertFailed = JoltAssertFailedImpl;
#endif
    g_factory = std::make_unique<JPH::Factory>();
    JPH::Factory::sInstance = g_factory.get();
    JPH::RegisterTypes();
}

void ReleaseJoltRuntime() {
    std::lock_guard<std::mutex> lock(g_runtimeMutex);
    if (--g_runtimeUsers > 0) {
        return;
    }
    JPH::UnregisterTypes();
    JPH::Factory::sInstance = nullptr;
    g_factory.reset();
}

JPH::EMotionType ToMotionType(BodyType type) {
    switch (type) {
        case BodyType::Static:    return JPH::EMotionType::Static;
        case BodyType::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyType::Dynamic:   return JPH::EMotionType::Dynamic;
    }
    return JPH::EMotionType::Dynamic;
}

std::optional<std::string> DescribeInvalidCollider(const ColliderConfig& collider) {
    switch (collider.shape) {
        case ColliderShape::Box:
            if (!(collider.width > 0.0f) || !(collider.height > 0.0f)) {
                return fmt::format("box needs a positive size, got {}x{}", collider.width, collider.height);
            }
            break;
        case ColliderShape::Circle:
            if (!(collider.radius > 0.0f)) {
                return fmt::format("circle needs a positive radius, got {}", collider.radius);
            }
            break;
        case ColliderShape::Polygon:
            if (collider.vertices.size() < 3) {
                return fmt::format("polygon needs at least 3 vertices, got {}", collider.vertices.size());
            }
            break;
    }
    return std::nullopt;
}

JPH::EActivation ActivationFor(BodyType type) {
    return type == BodyType::Static ? JPH::EActivation::DontActivate : JPH::EActivation::Activate;
}

} // namespace

namespace Layers {
static constexpr JPH::BroadPhaseLayer BP_NON_MOVING(0);
static constexpr JPH::BroadPhaseLayer BP_MOVING(1);
static constexpr JPH::uint NUM_BROAD_PHASE_LAYERS = 2;
} // namespace Layers

class JoltPhysicsWorld::BroadPhaseLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    explicit BroadPhaseLayerInterfaceImpl(const std::vector<ObjectLayerEntry>& layers)
        : m_layers(layers) {}

    JPH::uint GetNumBroadPhaseLayers() const override { return Layers::NUM_BROAD_PHASE_LAYERS; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer layer) const override {
        return m_layers[layer].moving ? Layers::BP_MOVING : Layers::BP_NON_MOVING;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const override {
        switch (layer.GetValue()) {
            case 0: return "NON_MOVING";
            case 1: return "MOVING";
            default: return "UNKNOWN";
        }
    }
#endif

private:
    const std::vector<ObjectLayerEntry>& m_layers;
};

// Two layers collide when each one's category is accepted by the other's mask.
class JoltPhysicsWorld::ObjectLayerPairFilterImpl final : public JPH::ObjectLayerPairFilter {
public:
    explicit ObjectLayerPairFilterImpl(const std::vector<ObjectLayerEntry>& layers)
        : m_layers(layers) {}

    bool ShouldCollide(JPH::ObjectLayer layer1, JPH::ObjectLayer layer2) const override {
        const ObjectLayerEntry& first = m_layers[layer1];
        const ObjectLayerEntry& second = m_layers[layer2];
        if (!first.moving && !second.moving) {
            return false;
        }
        return (first.category & second.mask) != 0 && (second.category & first.mask) != 0;
    }

private:
    const std::vector<ObjectLayerEntry>& m_layers;
};

class JoltPhysicsWorld::ObjectVsBroadPhaseLayerFilterImpl final : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    explicit ObjectVsBroadPhaseLayerFilterImpl(const std::vector<ObjectLayerEntry>& layers)
        : m_layers(layers) {}

    bool ShouldCollide(JPH::ObjectLayer layer1, JPH::BroadPhaseLayer layer2) const override {
        if (layer2 == Layers::BP_NON_MOVING) {
            return m_layers[layer1].moving;
        }
        return true;
    }

private:
    const std::vector<ObjectLayerEntry>& m_layers;
};

class JoltPhysicsWorld::ContactListenerImpl final : public JPH::ContactListener {
public:
    explicit ContactListenerImpl(const JoltPhysicsWorld& world)
        : m_world(world) {}

    void OnContactAdded(const JPH::Body& body1,
                        const JPH::Body& body2,
                        const JPH::ContactManifold& manifold,
                        JPH::ContactSettings& /*settings*/) override {
        PendingContact contact;
        contact.first = body1.GetID();
        contact.second = body2.GetID();
        contact.isSensor = body1.IsSensor() || body2.IsSensor();
        contact.started = true;
        if (manifold.mRelativeContactPointsOn1.size() > 0) {
            contact.hasPoint = true;
            contact.point = m_world.FromJoltPosition(manifold.GetWorldSpaceContactPointOn1(0));
        }
        const JPH::Vec3 normal = manifold.mWorldSpaceNormal;
        contact.normal = math::NormalizeOrZero(Vector2(normal.GetX(), normal.GetY()));

        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(contact);
    }

    void OnContactRemoved(const JPH::SubShapeIDPair& pair) override {
        PendingContact contact;
        contact.first = pair.GetBody1ID();
        contact.second = pair.GetBody2ID();
        contact.started = false;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(contact);
    }

    std::vector<PendingContact> TakePending() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<PendingContact> pending;
        pending.swap(m_pending);
        return pending;
    }

private:
    const JoltPhysicsWorld& m_world;
    std::mutex m_mutex;
    std::vector<PendingContact> m_pending;
};

JoltBody::JoltBody(JoltPhysicsWorld& world, BodyId id, const RigidBodyConfig& config)
    : m_world(world)
    , m_id(id)
    , m_config(config) {}

Vector2 JoltBody::GetPosition() const {
    return m_world.FromJoltPosition(m_world.GetBodyInterface().GetPosition(m_joltId));
}

float JoltBody::GetRotation() const {
    return JoltPhysicsWorld::FromJoltRotation(m_world.GetBodyInterface().GetRotation(m_joltId));
}

Vector2 JoltBody::GetVelocity() const {
    return m_world.FromJolt(m_world.GetBodyInterface().GetLinearVelocity(m_joltId));
}

float JoltBody::GetAngularVelocity() const {
    return glm::degrees(m_world.GetBodyInterface().GetAngularVelocity(m_joltId).GetZ());
}

void JoltBody::ApplyForce(const Vector2& force) {
    if (m_config.type != BodyType::Dynamic) {
        return;
    }
    m_world.GetBodyInterface().AddForce(m_joltId, m_world.ToJoltVector(force));
}

void JoltBody::ApplyImpulse(const Vector2& impulse) {
    if (m_config.type != BodyType::Dynamic) {
        return;
    }
    m_world.GetBodyInterface().AddImpulse(m_joltId, m_world.ToJoltVector(impulse));
}

void JoltBody::SetVelocity(const Vector2& velocity) {
    if (m_config.type == BodyType::Static) {
        return;
    }
    m_world.GetBodyInterface().SetLinearVelocity(m_joltId, m_world.ToJoltVector(velocity));
}

void JoltBody::SetAngularVelocity(float degreesPerSecond) {
    if (m_config.type == BodyType::Static) {
        return;
    }
    m_world.GetBodyInterface().SetAngularVelocity(m_joltId,
                                                  JPH::Vec3(0.0f, 0.0f, glm::radians(degreesPerSecond)));
}

void JoltBody::SetPosition(const Vector2& position) {
    m_world.GetBodyInterface().SetPosition(m_joltId,
                                           m_world.ToJoltPosition(position),
                                           ActivationFor(m_config.type));
}

void JoltBody::SetRotation(float degrees) {
    m_world.GetBodyInterface().SetRotation(m_joltId,
                                           JoltPhysicsWorld::ToJoltRotation(degrees),
                                           ActivationFor(m_config.type));
}

JoltPhysicsWorld::JoltPhysicsWorld(const PhysicsWorldConfig& config)
    : PhysicsWorld(config) {
    AcquireJoltRuntime();

    m_tempAllocator = std::make_unique<JPH::TempAllocatorImpl>(10 * 1024 * 1024);
    const JPH::uint32 threadCount = std::max(1u, std::thread::hardware_concurrency());
    const int jobSystemThreads = std::max(1, static_cast<int>(threadCount) - 1);
    m_jobSystem = std::make_unique<JPH::JobSystemThreadPool>(JPH::cMaxPhysicsJobs,
                                                             JPH::cMaxPhysicsBarriers,
                                                             jobSystemThreads);

    m_broadPhaseLayerInterface = std::make_unique<BroadPhaseLayerInterfaceImpl>(m_objectLayers);
    m_objectLayerPairFilter = std::make_unique<ObjectLayerPairFilterImpl>(m_objectLayers);
    m_objectVsBroadPhaseLayerFilter = std::make_unique<ObjectVsBroadPhaseLayerFilterImpl>(m_objectLayers);
    m_contactListener = std::make_unique<ContactListenerImpl>(*this);

    const JPH::uint32 maxBodies = std::max<JPH::uint32>(1, config.maxBodies);
    constexpr JPH::uint32 numBodyMutexes = 0;
    const JPH::uint32 maxBodyPairs = maxBodies;
    const JPH::uint32 maxContactConstraints = maxBodies;

    m_physicsSystem = std::make_unique<JPH::PhysicsSystem>();
    m_physicsSystem->Init(maxBodies,
                          numBodyMutexes,
                          maxBodyPairs,
                          maxContactConstraints,
                          *m_broadPhaseLayerInterface,
                          *m_objectVsBroadPhaseLayerFilter,
                          *m_objectLayerPairFilter);
    m_physicsSystem->SetContactListener(m_contactListener.get());

    SetGravity(config.gravity);

    core::Logger::Debug("[PhysicsWorld] Jolt backend initialized (threads: {}, maxBodies: {}, ppu: {})",
                        jobSystemThreads + 1, maxBodies, GetPixelsPerUnit());
}

JoltPhysicsWorld::~JoltPhysicsWorld() {
    Clear();
    m_retiredBodies.clear();

    m_physicsSystem.reset();
    m_contactListener.reset();
    m_objectVsBroadPhaseLayerFilter.reset();
    m_objectLayerPairFilter.reset();
    m_broadPhaseLayerInterface.reset();
    m_jobSystem.reset();
    m_tempAllocator.reset();

    ReleaseJoltRuntime();
}

PhysicsBody& JoltPhysicsWorld::CreateBody(const RigidBodyConfig& config) {
    auto body = std::make_unique<JoltBody>(*this, m_nextBodyId, config);
    JPH::Body* created = CreateJoltBody(*body,
                                        nullptr,
                                        ToJoltPosition(config.position),
                                        ToJoltRotation(config.rotation));
    ++m_nextBodyId;

    body->m_joltId = created->GetID();
    m_joltToBody[body->m_joltId.GetIndexAndSequenceNumber()] = body->m_id;
    GetBodyInterface().AddBody(body->m_joltId, ActivationFor(config.type));

    JoltBody& result = *body;
    m_bodies.emplace(body->m_id, std::move(body));
    return result;
}

void JoltPhysicsWorld::RemoveBody(BodyId id) {
    auto it = m_bodies.find(id);
    if (it == m_bodies.end()) {
        core::Logger::Debug("[PhysicsWorld] RemoveBody ignored unknown body {}", id);
        return;
    }

    DestroyJoltBody(it->second->m_joltId);
    it->second->m_joltId = JPH::BodyID();
    if (m_stepping) {
        m_retiredBodies.push_back(std::move(it->second));
    }
    m_bodies.erase(it);
}

void JoltPhysicsWorld::AddCollider(PhysicsBody& body, const ColliderConfig& collider) {
    auto it = m_bodies.find(body.GetId());
    if (it == m_bodies.end() || it->second.get() != &body) {
        throw core::PhysicsError("AddCollider",
                                 fmt::format("body {} does not belong to this world", body.GetId()));
    }
    JoltBody& joltBody = *it->second;

    if (const auto problem = DescribeInvalidCollider(collider)) {
        core::Logger::Warning("[PhysicsWorld] Rejected {} collider for body {}: {}",
                              ToString(collider.shape), joltBody.m_id, *problem);
        return;
    }

    JPH::BodyInterface& bodyInterface = GetBodyInterface();
    const JPH::BodyID oldId = joltBody.m_joltId;
    const JPH::RVec3 position = bodyInterface.GetPosition(oldId);
    const JPH::Quat rotation = bodyInterface.GetRotation(oldId);
    const JPH::Vec3 linearVelocity = bodyInterface.GetLinearVelocity(oldId);
    const JPH::Vec3 angularVelocity = bodyInterface.GetAngularVelocity(oldId);

    // Build the replacement first so a bad collider leaves the old body untouched.
    JPH::Body* created = CreateJoltBody(joltBody, &collider, position, rotation);

    DestroyJoltBody(oldId);
    joltBody.m_collider = collider;
    joltBody.m_joltId = created->GetID();
    m_joltToBody[joltBody.m_joltId.GetIndexAndSequenceNumber()] = joltBody.m_id;
    bodyInterface.AddBody(joltBody.m_joltId, ActivationFor(joltBody.m_config.type));

    if (joltBody.m_config.type != BodyType::Static) {
        bodyInterface.SetLinearAndAngularVelocity(joltBody.m_joltId, linearVelocity, angularVelocity);
    }
}

PhysicsBody* JoltPhysicsWorld::GetBody(BodyId id) const {
    auto it = m_bodies.find(id);
    return it != m_bodies.end() ? it->second.get() : nullptr;
}

void JoltPhysicsWorld::Clear() {
    for (auto& [id, body] : m_bodies) {
        DestroyJoltBody(body->m_joltId);
        body->m_joltId = JPH::BodyID();
        if (m_stepping) {
            m_retiredBodies.push_back(std::move(body));
        }
    }
    m_bodies.clear();
    m_joltToBody.clear();
    m_activePairs.clear();
    if (m_contactListener) {
        m_contactListener->TakePending();
    }
}

void JoltPhysicsWorld::Step(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        core::Logger::Warning("[PhysicsWorld] Ignoring step with invalid dt {}", deltaTime);
        return;
    }
    if (deltaTime == 0.0f) {
        return;
    }

    constexpr int collisionSteps = 1;
    m_stepping = true;
    const JPH::EPhysicsUpdateError error =
        m_physicsSystem->Update(deltaTime, collisionSteps, m_tempAllocator.get(), m_jobSystem.get());
    if (error != JPH::EPhysicsUpdateError::None) {
        core::Logger::Warning("[PhysicsWorld] Jolt update reported error flags 0x{:x}",
                              static_cast<unsigned>(error));
    }

    try {
        FlushContacts();
    } catch (...) {
        m_stepping = false;
        m_retiredBodies.clear();
        throw;
    }
    m_stepping = false;
    m_retiredBodies.clear();
}

void JoltPhysicsWorld::SetGravity(const Vector2& gravity) {
    m_physicsSystem->SetGravity(ToJoltVector(gravity));
}

Vector2 JoltPhysicsWorld::GetGravity() const {
    return FromJolt(m_physicsSystem->GetGravity());
}

std::optional<RaycastHit> JoltPhysicsWorld::Raycast(const Vector2& origin,
                                                    const Vector2& direction,
                                                    float maxDistance) const {
    const Vector2 unit = math::NormalizeOrZero(direction);
    if (unit == Vector2(0.0f) || !std::isfinite(maxDistance) || maxDistance <= 0.0f) {
        return std::nullopt;
    }

    const JPH::RRayCast ray(ToJoltPosition(origin), ToJoltVector(unit * maxDistance));
    JPH::RayCastResult result;
    if (!m_physicsSystem->GetNarrowPhaseQuery().CastRay(ray, result)) {
        return std::nullopt;
    }

    JoltBody* body = FindByJoltId(result.mBodyID);
    if (!body) {
        return std::nullopt;
    }

    const JPH::RVec3 point = ray.GetPointOnRay(result.mFraction);
    RaycastHit hit;
    hit.body = body;
    hit.point = FromJoltPosition(point);
    hit.distance = result.mFraction * maxDistance;

    JPH::BodyLockRead lock(m_physicsSystem->GetBodyLockInterface(), result.mBodyID);
    if (lock.Succeeded()) {
        const JPH::Vec3 normal = lock.GetBody().GetWorldSpaceSurfaceNormal(result.mSubShapeID2, point);
        hit.normal = math::NormalizeOrZero(Vector2(normal.GetX(), normal.GetY()));
    }
    return hit;
}

std::vector<PhysicsBody*> JoltPhysicsWorld::QueryAABB(const Vector2& min, const Vector2& max) const {
    const Vector2 lower = glm::min(min, max);
    const Vector2 upper = glm::max(min, max);
    const float ppu = GetPixelsPerUnit();
    const JPH::AABox box(JPH::Vec3(lower.x / ppu, lower.y / ppu, -kHalfDepth),
                         JPH::Vec3(upper.x / ppu, upper.y / ppu, kHalfDepth));

    JPH::AllHitCollisionCollector<JPH::CollideShapeBodyCollector> collector;
    m_physicsSystem->GetBroadPhaseQuery().CollideAABox(box, collector);

    std::vector<PhysicsBody*> bodies;
    bodies.reserve(collector.mHits.size());
    for (const JPH::BodyID& id : collector.mHits) {
        if (JoltBody* body = FindByJoltId(id)) {
            bodies.push_back(body);
        }
    }
    std::sort(bodies.begin(), bodies.end(),
              [](const PhysicsBody* a, const PhysicsBody* b) { return a->GetId() < b->GetId(); });
    return bodies;
}

JPH::ObjectLayer JoltPhysicsWorld::ResolveObjectLayer(const RigidBodyConfig& config,
                                                      const ColliderConfig* collider) {
    CollisionLayerRegistry& layers = GetCollisionLayers();

    ObjectLayerEntry entry;
    entry.moving = config.type != BodyType::Static;
    if (collider) {
        entry.category = layers.Category(collider->layer.empty() ? CollisionLayerRegistry::kDefaultLayer
                                                                 : collider->layer);
        entry.mask = layers.Mask(collider->mask);
    } else {
        entry.category = layers.Category(CollisionLayerRegistry::kDefaultLayer);
        entry.mask = CollisionLayerRegistry::kAllLayers;
    }

    for (std::size_t i = 0; i < m_objectLayers.size(); ++i) {
        const ObjectLayerEntry& existing = m_objectLayers[i];
        if (existing.category == entry.category && existing.mask == entry.mask &&
            existing.moving == entry.moving) {
            return static_cast<JPH::ObjectLayer>(i);
        }
    }

    if (m_objectLayers.size() >= static_cast<std::size_t>(JPH::cObjectLayerInvalid)) {
        throw core::PhysicsError("layer assignment", "too many distinct category/mask combinations");
    }
    m_objectLayers.push_back(entry);
    return static_cast<JPH::ObjectLayer>(m_objectLayers.size() - 1);
}

JPH::ShapeRefC JoltPhysicsWorld::BuildShape(const ColliderConfig& collider) const {
    const float ppu = GetPixelsPerUnit();
    JPH::ShapeSettings::ShapeResult result;

    switch (collider.shape) {
        case ColliderShape::Box: {
            JPH::BoxShapeSettings settings(JPH::Vec3(0.5f * collider.width / ppu,
                                                     0.5f * collider.height / ppu,
                                                     kHalfDepth),
                                           0.0f);
            result = settings.Create();
            break;
        }
        case ColliderShape::Circle: {
            JPH::SphereShapeSettings settings(collider.radius / ppu);
            result = settings.Create();
            break;
        }
        case ColliderShape::Polygon: {
            JPH::Array<JPH::Vec3> points;
            points.reserve(collider.vertices.size() * 2);
            for (const Vector2& vertex : collider.vertices) {
                points.push_back(JPH::Vec3(vertex.x / ppu, vertex.y / ppu, -kHalfDepth));
                points.push_back(JPH::Vec3(vertex.x / ppu, vertex.y / ppu, kHalfDepth));
            }
            JPH::ConvexHullShapeSettings settings(points, 0.0f);
            result = settings.Create();
            break;
        }
    }

    if (result.HasError()) {
        throw core::PhysicsError("shape creation", std::string(result.GetError().c_str()));
    }
    JPH::ShapeRefC shape = result.Get();

    if (collider.offset != Vector2(0.0f)) {
        JPH::RotatedTranslatedShapeSettings offsetSettings(ToJoltVector(collider.offset),
                                                           JPH::Quat::sIdentity(),
                                                           shape.GetPtr());
        JPH::ShapeSettings::ShapeResult offsetResult = offsetSettings.Create();
        if (offsetResult.HasError()) {
            throw core::PhysicsError("shape creation", std::string(offsetResult.GetError().c_str()));
        }
        shape = offsetResult.Get();
    }
    return shape;
}

JPH::Body* JoltPhysicsWorld::CreateJoltBody(JoltBody& body,
                                            const ColliderConfig* collider,
                                            const JPH::RVec3& position,
                                            const JPH::Quat& rotation) {
    ColliderConfig placeholder;
    placeholder.width = kPlaceholderSize;
    placeholder.height = kPlaceholderSize;
    JPH::ShapeRefC shape = BuildShape(collider ? *collider : placeholder);

    const RigidBodyConfig& config = body.m_config;
    JPH::BodyCreationSettings settings(shape,
                                       position,
                                       rotation,
                                       ToMotionType(config.type),
                                       ResolveObjectLayer(config, collider));

    if (config.type != BodyType::Static) {
        settings.mAllowedDOFs = config.fixedRotation
            ? (JPH::EAllowedDOFs::TranslationX | JPH::EAllowedDOFs::TranslationY)
            : JPH::EAllowedDOFs::Plane2D;
    }
    settings.mFriction = config.friction;
    settings.mRestitution = config.restitution;
    settings.mLinearDamping = config.linearDamping;
    settings.mAngularDamping = config.angularDamping;
    settings.mGravityFactor = config.gravityScale;
    settings.mMotionQuality = config.bullet ? JPH::EMotionQuality::LinearCast : JPH::EMotionQuality::Discrete;
    settings.mIsSensor = collider != nullptr && collider->isTrigger;
    settings.mAllowSleeping = true;
    settings.mUserData = static_cast<JPH::uint64>(body.m_id);
    if (config.type == BodyType::Kinematic) {
        settings.mCollideKinematicVsNonDynamic = true;
    }

    if (config.mass) {
        if (*config.mass > 0.0f) {
            settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = *config.mass;
        } else {
            core::Logger::Warning("[PhysicsWorld] Ignoring non-positive mass {} for body {}",
                                  *config.mass, body.m_id);
        }
    }

    JPH::Body* created = GetBodyInterface().CreateBody(settings);
    if (!created) {
        throw core::PhysicsError("CreateBody",
                                 fmt::format("Jolt could not allocate body {} ({} bodies live)",
                                             body.m_id, m_bodies.size()));
    }
    return created;
}

void JoltPhysicsWorld::DestroyJoltBody(JPH::BodyID id) {
    if (id.IsInvalid()) {
        return;
    }
    JPH::BodyInterface& bodyInterface = GetBodyInterface();
    bodyInterface.RemoveBody(id);
    bodyInterface.DestroyBody(id);
    m_joltToBody.erase(id.GetIndexAndSequenceNumber());

    for (auto it = m_activePairs.begin(); it != m_activePairs.end();) {
        if (it->second.first == id || it->second.second == id) {
            it = m_activePairs.erase(it);
        } else {
            ++it;
        }
    }
}

void JoltPhysicsWorld::FlushContacts() {
    const std::vector<PendingContact> pending = m_contactListener->TakePending();
    for (const PendingContact& contact : pending) {
        const std::uint64_t key = PairKey(contact.first, contact.second);

        if (contact.started) {
            if (m_activePairs.count(key) > 0) {
                continue;
            }
            JoltBody* first = FindByJoltId(contact.first);
            JoltBody* second = FindByJoltId(contact.second);
            if (!first || !second) {
                continue;
            }
            m_activePairs.emplace(key, ActivePair{ contact.first, contact.second, contact.isSensor });

            CollisionEvent event;
            event.bodyA = first;
            event.bodyB = second;
            event.isSensor = contact.isSensor;
            if (contact.hasPoint) {
                event.contacts.push_back(ContactPoint{ contact.point, contact.normal });
            }
            DispatchCollisionStart(event);
            continue;
        }

        auto it = m_activePairs.find(key);
        if (it == m_activePairs.end()) {
            continue;
        }
        const ActivePair pair = it->second;
        m_activePairs.erase(it);

        JoltBody* first = FindByJoltId(pair.first);
        JoltBody* second = FindByJoltId(pair.second);
        if (!first || !second) {
            continue;
        }
        CollisionEvent event;
        event.bodyA = first;
        event.bodyB = second;
        event.isSensor = pair.isSensor;
        DispatchCollisionEnd(event);
    }
}

JoltBody* JoltPhysicsWorld::FindByJoltId(const JPH::BodyID& id) const {
    auto mapping = m_joltToBody.find(id.GetIndexAndSequenceNumber());
    if (mapping == m_joltToBody.end()) {
        return nullptr;
    }
    auto it = m_bodies.find(mapping->second);
    return it != m_bodies.end() ? it->second.get() : nullptr;
}

JPH::BodyInterface& JoltPhysicsWorld::GetBodyInterface() const {
    return m_physicsSystem->GetBodyInterface();
}

JPH::RVec3 JoltPhysicsWorld::ToJoltPosition(const Vector2& pixels) const {
    const float ppu = GetPixelsPerUnit();
    return JPH::RVec3(pixels.x / ppu, pixels.y / ppu, 0.0f);
}

JPH::Vec3 JoltPhysicsWorld::ToJoltVector(const Vector2& pixels) const {
    const float ppu = GetPixelsPerUnit();
    return JPH::Vec3(pixels.x / ppu, pixels.y / ppu, 0.0f);
}

Vector2 JoltPhysicsWorld::FromJolt(JPH::Vec3Arg meters) const {
    const float ppu = GetPixelsPerUnit();
    return Vector2(meters.GetX() * ppu, meters.GetY() * ppu);
}

Vector2 JoltPhysicsWorld::FromJoltPosition(const JPH::RVec3& meters) const {
    const float ppu = GetPixelsPerUnit();
    return Vector2(static_cast<float>(meters.GetX()) * ppu, static_cast<float>(meters.GetY()) * ppu);
}

JPH::Quat JoltPhysicsWorld::ToJoltRotation(float degrees) {
    return JPH::Quat::sRotation(JPH::Vec3::sAxisZ(), glm::radians(degrees));
}

float JoltPhysicsWorld::FromJoltRotation(const JPH::Quat& rotation) {
    float degrees = glm::degrees(2.0f * std::atan2(rotation.GetZ(), rotation.GetW()));
    if (degrees > 180.0f) {
        degrees -= 360.0f;
    } else if (degrees <= -180.0f) {
        degrees += 360.0f;
    }
    return degrees;
}

std::uint64_t JoltPhysicsWorld::PairKey(const JPH::BodyID& a, const JPH::BodyID& b) {
    const std::uint64_t first = a.GetIndexAndSequenceNumber();
    const std::uint64_t second = b.GetIndexAndSequenceNumber();
    return first < second ? (first << 32) | second : (second << 32) | first;
}

} // namespace bonk::physics
