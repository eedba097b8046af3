#include "FakePhysicsWorld.hpp"

#include "bonk/core/InputProvider.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/scene/Behavior.hpp"
#include "bonk/scene/Scene.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;
using bonk::scene::YieldInstruction;

namespace {

using Log = std::vector<std::string>;

class Recorder : public bonk::Behavior {
public:
    Recorder(std::string label, Log& log) : m_label(std::move(label)), m_log(log) {}

    void Awake() override { m_log.push_back(m_label + ".Awake"); }
    void Start() override { m_log.push_back(m_label + ".Start"); }
    void FixedUpdate() override { m_log.push_back(m_label + ".FixedUpdate"); }
    void Update() override { m_log.push_back(m_label + ".Update"); }
    void LateUpdate() override { m_log.push_back(m_label + ".LateUpdate"); }
    void OnDestroy() override { m_log.push_back(m_label + ".OnDestroy"); }

private:
    std::string m_label;
    Log& m_log;
};

class Thrower : public bonk::Behavior {
public:
    void Update() override { throw std::runtime_error("script failure"); }
};

class Counter : public bonk::Behavior {
public:
    void Update() override { ++updates; }
    int updates = 0;
};

// Flips a flag after a scaled delay started on Start.
class DelayedFlag : public bonk::Behavior {
public:
    explicit DelayedFlag(float seconds) : m_seconds(seconds) {}

    void Start() override {
        handle = StartCoroutine(bonk::scene::CoroutineSequence()
                                    .WaitSeconds(m_seconds)
                                    .Then([this] { fired = true; })
                                    .Build());
    }

    bonk::scene::CoroutineHandle handle;
    bool fired = false;

private:
    float m_seconds;
};

class SelfDestruct : public bonk::Behavior {
public:
    explicit SelfDestruct(float seconds) : m_seconds(seconds) {}

    void Start() override { DestroyAfter(m_seconds); }
    void OnDestroy() override {
        ++destroyCalls;
        coroutinesAtDestroy = GetActiveCoroutineCount();
        foundDuringDestroy = Find(GetGameObject()->GetName()) != nullptr;
    }

    int destroyCalls = 0;
    std::size_t coroutinesAtDestroy = 99;
    bool foundDuringDestroy = true;

private:
    float m_seconds;
};

class ScriptedInput : public bonk::core::InputProvider {
public:
    float GetAxis(const std::string& name) const override { return name == "Horizontal" ? 0.5f : 0.0f; }
    float GetAxisRaw(const std::string& name) const override { return name == "Horizontal" ? 1.0f : 0.0f; }
    bool GetButton(const std::string& name) const override { return name == "Jump"; }
    bool GetButtonDown(const std::string& name) const override { return name == "Jump"; }
    bool GetButtonUp(const std::string&) const override { return false; }
    bool GetKey(const std::string& code) const override { return code == "Space"; }
    bool GetKeyDown(const std::string&) const override { return false; }
    bool GetKeyUp(const std::string&) const override { return false; }
    bonk::Vector2 GetMousePosition() const override { return {320.0f, 240.0f}; }
    bool GetMouseButton(int button) const override { return button == 0; }
    bool GetMouseButtonDown(int) const override { return false; }
};

struct ErrorCapture {
    std::vector<std::string> lines;
    std::size_t token = 0;

    ErrorCapture() {
        token = bonk::core::Logger::RegisterListener([this](bonk::core::LogLevel level, const std::string& line) {
            if (level == bonk::core::LogLevel::Error) {
                lines.push_back(line);
            }
        });
    }
    ~ErrorCapture() { bonk::core::Logger::UnregisterListener(token); }
};

std::unique_ptr<bonk::Scene> MakeScene(bonk::SceneSettings settings = bonk::test::FakeSceneSettings()) {
    return std::make_unique<bonk::Scene>("BehaviorScene", std::move(settings), bonk::test::FakeBackends());
}

} // namespace

TEST_CASE("Every behavior awakes before any behavior starts", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    Log log;
    auto a = scene->CreateGameObject("A");
    auto b = scene->CreateGameObject("B");
    a->AddBehavior<Recorder>("A", log);
    b->AddBehavior<Recorder>("B", log);

    scene->Start();

    CHECK(log == Log{"A.Awake", "B.Awake", "A.Start", "B.Start"});
}

TEST_CASE("A frame runs the phases in order", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    Log log;
    scene->CreateGameObject("A")->AddBehavior<Recorder>("A", log);
    scene->Start();
    log.clear();

    scene->RunFrame(0.25f);

    CHECK(log == Log{"A.FixedUpdate", "A.Update", "A.LateUpdate"});
}

TEST_CASE("Children run after their parent within a phase", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    Log log;
    auto parent = scene->CreateGameObject("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);
    parent->AddBehavior<Recorder>("P", log);
    child->AddBehavior<Recorder>("C", log);

    scene->Start();
    log.clear();
    scene->Update();

    CHECK(log == Log{"P.Update", "C.Update"});
}

TEST_CASE("Objects added to a running scene catch up before their first update", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    scene->Start();

    Log log;
    auto late = bonk::GameObject::Create("Late");
    late->AddBehavior<Recorder>("L", log);
    scene->Add(late);

    CHECK(log == Log{"L.Awake", "L.Start"});
    CHECK(late->IsStarted());

    scene->RunFrame(0.25f);
    CHECK(log.size() == 5);
}

TEST_CASE("Behaviors added to a live object catch up immediately", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Live");
    scene->Start();

    Log log;
    auto recorder = object->AddBehavior<Recorder>("R", log);

    CHECK(log == Log{"R.Awake", "R.Start"});
    CHECK(recorder->HasAwoken());
    CHECK(recorder->HasStarted());
}

TEST_CASE("A throwing hook does not stop the frame", "[behavior][faults]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Faulty");
    object->AddBehavior<Thrower>();
    auto counter = object->AddBehavior<Counter>();
    auto other = scene->CreateGameObject("Other")->AddBehavior<Counter>();

    ErrorCapture errors;
    scene->RunFrame(0.25f);
    scene->RunFrame(0.25f);

    CHECK(counter->updates == 2);
    CHECK(other->updates == 2);
    REQUIRE(errors.lines.size() == 2);
    CHECK(errors.lines.front().find("Update") != std::string::npos);
    CHECK(errors.lines.front().find("script failure") != std::string::npos);
    CHECK(errors.lines.front().find("'Faulty'") != std::string::npos);
}

TEST_CASE("Disabled behaviors skip hooks and coroutines", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Object");
    auto counter = object->AddBehavior<Counter>();
    auto flag = object->AddBehavior<DelayedFlag>(0.25f);
    scene->RunFrame(0.25f);

    counter->SetEnabled(false);
    flag->SetEnabled(false);
    for (int i = 0; i < 4; ++i) {
        scene->RunFrame(0.25f);
    }
    CHECK(counter->updates == 1);
    CHECK_FALSE(flag->fired);

    counter->SetEnabled(true);
    flag->SetEnabled(true);
    scene->RunFrame(0.25f);
    CHECK(counter->updates == 2);
    CHECK(flag->fired);
}

TEST_CASE("Disabling a GameObject pauses its whole subtree", "[behavior][lifecycle]") {
    auto scene = MakeScene();
    auto parent = scene->CreateGameObject("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);
    auto counter = child->AddBehavior<Counter>();

    parent->SetEnabled(false);
    scene->RunFrame(0.25f);
    CHECK(counter->updates == 0);
    CHECK(child->IsStarted());

    parent->SetEnabled(true);
    scene->RunFrame(0.25f);
    CHECK(counter->updates == 1);
}

TEST_CASE("Coroutine waits follow the scene time scale", "[behavior][time]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.timeScale = 0.0f;
    auto scene = MakeScene(settings);
    auto flag = scene->CreateGameObject("Timer")->AddBehavior<DelayedFlag>(0.5f);

    for (int i = 0; i < 10; ++i) {
        scene->RunFrame(0.25f);
    }
    CHECK_FALSE(flag->fired);
    CHECK(flag->DeltaTime() == 0.0f);

    flag->SetTimeScale(2.0f);
    scene->RunFrame(0.25f);

    CHECK(flag->fired);
    CHECK_THAT(flag->DeltaTime(), WithinAbs(0.5f, 1e-6));
    CHECK_THAT(flag->TimeScale(), WithinAbs(2.0f, 1e-6));
}

TEST_CASE("DestroyAfter removes the owner once the delay has passed", "[behavior][destroy]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Fuse");
    auto fuse = object->AddBehavior<SelfDestruct>(0.5f);

    scene->RunFrame(0.25f);
    scene->RunFrame(0.25f);
    CHECK(scene->FindByName("Fuse") == object);
    CHECK_FALSE(object->IsDestroyed());

    scene->RunFrame(0.25f);
    CHECK(scene->FindByName("Fuse") == nullptr);
    CHECK(object->IsDestroyed());
    CHECK(fuse->IsDestroyed());
    CHECK(fuse->destroyCalls == 1);
    CHECK(fuse->coroutinesAtDestroy == 0);
    CHECK_FALSE(fuse->foundDuringDestroy);

    scene->RunFrame(0.25f);
    CHECK(fuse->destroyCalls == 1);
}

TEST_CASE("Destroyed behaviors refuse new coroutines", "[behavior][destroy]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Gone");
    auto counter = object->AddBehavior<Counter>();
    scene->Destroy(*object);
    scene->ProcessPendingDestroy();

    auto handle = counter->StartCoroutine([] { return YieldInstruction::Finish(); });
    CHECK_FALSE(handle.IsValid());
}

TEST_CASE("Behavior scene queries", "[behavior][queries]") {
    auto scene = MakeScene();
    auto seeker = scene->CreateGameObject("Seeker")->AddBehavior<Counter>();
    auto target = scene->CreateGameObject("Target");
    target->SetTag("enemy");
    auto nested = bonk::GameObject::Create("Nested");
    nested->SetTag("enemy");
    target->AddChild(nested);

    CHECK(seeker->Find("Target") == target);
    CHECK(seeker->Find("Nested") == nested);
    CHECK(seeker->Find("Missing") == nullptr);
    CHECK(seeker->FindWithTag("enemy").size() == 2);
    CHECK(seeker->FindWithTag("").empty());
}

TEST_CASE("Detached behaviors answer queries with neutral values", "[behavior][queries]") {
    auto object = bonk::GameObject::Create("Loose");
    auto counter = object->AddBehavior<Counter>();

    CHECK(counter->GetScene() == nullptr);
    CHECK(counter->Find("Loose") == nullptr);
    CHECK(counter->DeltaTime() == 0.0f);
    CHECK(counter->GetAxis("Horizontal") == 0.0f);
    CHECK_FALSE(counter->GetButton("Jump"));
    CHECK(counter->GetRigidBody() == nullptr);
}

TEST_CASE("Behavior input helpers read the scene input provider", "[behavior][input]") {
    auto scene = MakeScene();
    auto counter = scene->CreateGameObject("Player")->AddBehavior<Counter>();

    CHECK(counter->GetAxis("Horizontal") == 0.0f);
    CHECK_FALSE(counter->GetKey("Space"));

    scene->SetInputProvider(std::make_shared<ScriptedInput>());

    CHECK_THAT(counter->GetAxis("Horizontal"), WithinAbs(0.5f, 1e-6));
    CHECK(counter->GetAxisRaw("Horizontal") == 1.0f);
    CHECK(counter->GetButton("Jump"));
    CHECK(counter->GetButtonDown("Jump"));
    CHECK_FALSE(counter->GetButtonUp("Jump"));
    CHECK(counter->GetKey("Space"));
    CHECK(counter->GetMouseButton(0));
    CHECK_FALSE(counter->GetMouseButton(1));
    CHECK(counter->GetMousePosition() == bonk::Vector2(320.0f, 240.0f));
}

TEST_CASE("Behavior events reach other behaviors", "[behavior][events]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Speaker");
    auto speaker = object->AddBehavior<Counter>();
    auto listener = object->AddBehavior<Counter>();

    int heard = 0;
    auto subscription = speaker->Events().Subscribe("hurt", [&](const std::any& payload) {
        heard += std::any_cast<int>(payload);
    });

    speaker->Events().Emit("hurt", 3);
    CHECK(heard == 3);

    scene->Destroy(*object);
    scene->ProcessPendingDestroy();
    speaker->Events().Emit("hurt", 3);
    CHECK(heard == 3);
    CHECK(listener->IsDestroyed());
}
