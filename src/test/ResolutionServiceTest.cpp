#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "application/ResolutionService.hpp"
#include "domain/DependencyGraph.hpp"
#include "test/TestDoubles.hpp"

using namespace zlinker;
using application::ResolutionMode;
using application::ResolutionService;
using domain::LinkErrorKind;
using domain::LinkNode;
using test::IdentityEncoder;
using test::RecordingRegistry;
using Kind = RecordingRegistry::Call::Kind;

namespace {

const std::string kPrefix = "https://quest.fortuna-events.fr?z=";

std::vector<LinkNode> MakeLinked(const std::vector<std::pair<std::string, std::string>>& fragments) {
    std::vector<LinkNode> nodes;
    for (const auto& [name, text] : fragments) {
        nodes.emplace_back(test::QuestTarget(), name, text);
    }
    domain::DependencyGraphBuilder::Link(nodes);
    return nodes;
}

// Final text as currently registered for a node, with the URL prefix removed.
std::string FinalText(const RecordingRegistry& registry, const LinkNode& node) {
    const std::string& longUrl = registry.targets.at(*node.getUrl());
    assert(longUrl.rfind(kPrefix, 0) == 0);
    return longUrl.substr(kPrefix.size());
}

void TestCyclicTwoPhase() {
    auto registry = std::make_shared<RecordingRegistry>();
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$A", "see $B"}, {"$B", "see $A"}});

    auto error = service.resolveAll(nodes, ResolutionMode::TwoPhase);
    assert(!error);

    assert(registry->calls.size() == 4);
    assert(registry->calls[0].kind == Kind::Create);
    assert(registry->calls[0].longUrl == kPrefix + "see $B");
    assert(registry->calls[0].findExisting);
    assert(registry->calls[1].kind == Kind::Create);
    assert(registry->calls[1].longUrl == kPrefix + "see $A");

    const std::string urlA = *nodes[0].getUrl();
    const std::string urlB = *nodes[1].getUrl();
    assert(registry->calls[2].kind == Kind::Update);
    assert(registry->calls[2].shortUrl == urlA);
    assert(registry->calls[2].longUrl == kPrefix + "see " + urlB);
    assert(registry->calls[3].kind == Kind::Update);
    assert(registry->calls[3].shortUrl == urlB);
    assert(registry->calls[3].longUrl == kPrefix + "see " + urlA);

    assert(nodes[0].isResolved() && nodes[1].isResolved());
    std::cout << "[PASS] Two-phase resolves a mutual reference." << std::endl;
}

void TestCyclicFastFails() {
    auto registry = std::make_shared<RecordingRegistry>();
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$A", "see $B"}, {"$B", "see $A"}});

    auto error = service.resolveAll(nodes, ResolutionMode::Fast);
    assert(error);
    assert(error->kind == LinkErrorKind::Cycle);
    assert(error->message.find("fast") != std::string::npos);
    assert(registry->calls.empty());
    assert(!nodes[0].isResolved() && !nodes[1].isResolved());
    std::cout << "[PASS] Fast mode reports a cycle without registry writes." << std::endl;
}

void TestFastStallsAfterPartialProgress() {
    auto registry = std::make_shared<RecordingRegistry>();
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$R", "root"}, {"$A", "$R and $B"}, {"$B", "$A"}});

    auto error = service.resolveAll(nodes, ResolutionMode::Fast);
    assert(error && error->kind == LinkErrorKind::Cycle);
    assert(registry->calls.size() == 1);
    assert(nodes[0].isResolved());
    assert(error->message.find("$A") != std::string::npos);
    assert(error->message.find("$B") != std::string::npos);
    std::cout << "[PASS] Fast mode stops at the stall and names the unresolved links." << std::endl;
}

void TestAcyclicScenario() {
    auto fastRegistry = std::make_shared<RecordingRegistry>();
    ResolutionService fast(fastRegistry, std::make_shared<IdentityEncoder>());
    auto fastNodes = MakeLinked({{"$A", "root"}, {"$B", "child of $A"}});

    assert(!fast.resolveAll(fastNodes, ResolutionMode::Fast));
    assert(fastRegistry->calls.size() == 2);
    assert(fastRegistry->calls[0].longUrl == kPrefix + "root");
    assert(!fastRegistry->calls[0].findExisting);
    assert(fastRegistry->calls[1].longUrl == kPrefix + "child of " + *fastNodes[0].getUrl());
    assert(!fastRegistry->calls[1].findExisting);

    auto twoPhaseRegistry = std::make_shared<RecordingRegistry>();
    ResolutionService twoPhase(twoPhaseRegistry, std::make_shared<IdentityEncoder>());
    auto twoPhaseNodes = MakeLinked({{"$A", "root"}, {"$B", "child of $A"}});

    assert(!twoPhase.resolveAll(twoPhaseNodes, ResolutionMode::TwoPhase));
    assert(twoPhaseRegistry->calls.size() == 4);
    assert(FinalText(*twoPhaseRegistry, twoPhaseNodes[1]) == "child of " + *twoPhaseNodes[0].getUrl());
    std::cout << "[PASS] Acyclic scenario: 2 calls fast, 4 calls two-phase." << std::endl;
}

void TestEquivalenceOnAcyclicGraph() {
    // Declared out of dependency order on purpose.
    const std::vector<std::pair<std::string, std::string>> fragments = {
        {"$TOP", "go to $MID or $LEAF"},
        {"$MID", "then $LEAF, twice: $LEAF"},
        {"$LEAF", "the end"},
        {"$SOLO", "alone"},
    };

    auto fastRegistry = std::make_shared<RecordingRegistry>();
    auto fastNodes = MakeLinked(fragments);
    assert(!ResolutionService(fastRegistry, std::make_shared<IdentityEncoder>())
                .resolveAll(fastNodes, ResolutionMode::Fast));

    auto slowRegistry = std::make_shared<RecordingRegistry>();
    auto slowNodes = MakeLinked(fragments);
    assert(!ResolutionService(slowRegistry, std::make_shared<IdentityEncoder>())
                .resolveAll(slowNodes, ResolutionMode::TwoPhase));

    assert(fastRegistry->calls.size() == fragments.size());
    assert(slowRegistry->count(Kind::Create) == fragments.size());
    assert(slowRegistry->count(Kind::Update) == fragments.size());

    // Each step takes the first ready node in declaration order.
    const std::string leafUrl = *fastNodes[2].getUrl();
    assert(fastRegistry->calls[0].longUrl == kPrefix + "the end");
    assert(fastRegistry->calls[1].longUrl == kPrefix + "then " + leafUrl + ", twice: " + leafUrl);
    assert(fastRegistry->calls[2].longUrl == kPrefix + "go to " + *fastNodes[1].getUrl() + " or " + leafUrl);
    assert(fastRegistry->calls[3].longUrl == kPrefix + "alone");

    // Short codes differ between runs; compare with URLs mapped back to names.
    auto normalize = [](std::string text, const std::vector<LinkNode>& nodes) {
        for (const auto& node : nodes) {
            const std::string& url = *node.getUrl();
            size_t pos = 0;
            while ((pos = text.find(url, pos)) != std::string::npos) {
                text.replace(pos, url.size(), "<" + node.getName() + ">");
                pos += node.getName().size() + 2;
            }
        }
        return text;
    };

    for (size_t i = 0; i < fragments.size(); ++i) {
        std::string fastText = normalize(FinalText(*fastRegistry, fastNodes[i]), fastNodes);
        std::string slowText = normalize(FinalText(*slowRegistry, slowNodes[i]), slowNodes);
        assert(fastText == slowText);
        for (size_t dep : slowNodes[i].getDependencies()) {
            assert(FinalText(*slowRegistry, slowNodes[i]).find(slowNodes[dep].getName()) == std::string::npos);
        }
    }
    assert(normalize(FinalText(*slowRegistry, slowNodes[1]), slowNodes) == "then <$LEAF>, twice: <$LEAF>");
    std::cout << "[PASS] Both modes produce the same final text on an acyclic graph." << std::endl;
}

void TestSelfLoop() {
    auto registry = std::make_shared<RecordingRegistry>();
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$SELF", "share $SELF"}});
    assert(nodes[0].getDependencies() == std::vector<size_t>{0});

    assert(!service.resolveAll(nodes, ResolutionMode::TwoPhase));
    assert(FinalText(*registry, nodes[0]) == "share " + *nodes[0].getUrl());

    auto fastRegistry = std::make_shared<RecordingRegistry>();
    auto fastNodes = MakeLinked({{"$SELF", "share $SELF"}});
    auto error = ResolutionService(fastRegistry, std::make_shared<IdentityEncoder>())
                     .resolveAll(fastNodes, ResolutionMode::Fast);
    assert(error && error->kind == LinkErrorKind::Cycle);
    assert(fastRegistry->calls.empty());
    std::cout << "[PASS] Self reference: two-phase substitutes its own URL, fast reports a cycle." << std::endl;
}

void TestPhaseOneSkipsExistingUrl() {
    auto registry = std::make_shared<RecordingRegistry>();
    auto existing = registry->createOrFind(kPrefix + "old content", false);
    registry->calls.clear();

    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$A", "new content"}, {"$B", "$A"}});
    nodes[0].assignUrl(existing.shortUrl);

    assert(!service.resolveAll(nodes, ResolutionMode::TwoPhase));
    assert(registry->count(Kind::Create) == 1);
    assert(registry->count(Kind::Update) == 2);
    assert(registry->targets.at(existing.shortUrl) == kPrefix + "new content");
    assert(FinalText(*registry, nodes[1]) == existing.shortUrl);
    std::cout << "[PASS] Phase 1 keeps an existing URL, Phase 2 still updates it." << std::endl;
}

void TestRegistryFailureAborts() {
    auto registry = std::make_shared<RecordingRegistry>();
    registry->failAt = 1;
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$A", "a"}, {"$B", "b"}, {"$C", "c"}});

    auto error = service.resolveAll(nodes, ResolutionMode::TwoPhase);
    assert(error && error->kind == LinkErrorKind::Registry);
    assert(error->message.find("500") != std::string::npos);
    assert(registry->calls.size() == 2);
    assert(nodes[0].getUrl() && !nodes[1].getUrl() && !nodes[2].getUrl());
    assert(!nodes[0].isResolved());

    auto updateRegistry = std::make_shared<RecordingRegistry>();
    updateRegistry->failAt = 3;
    auto updateNodes = MakeLinked({{"$A", "a"}, {"$B", "b"}, {"$C", "c"}});
    auto updateError = ResolutionService(updateRegistry, std::make_shared<IdentityEncoder>())
                           .resolveAll(updateNodes, ResolutionMode::TwoPhase);
    assert(updateError && updateError->kind == LinkErrorKind::Registry);
    assert(updateRegistry->calls.size() == 4);
    assert(!updateNodes[0].isResolved());
    std::cout << "[PASS] A registry failure stops the run immediately." << std::endl;
}

void TestStepCallback() {
    auto registry = std::make_shared<RecordingRegistry>();
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"$A", "a"}, {"$B", "$A"}, {"$C", "$B"}});

    int steps = 0;
    assert(!service.resolveAll(nodes, ResolutionMode::TwoPhase, [&steps](const std::vector<LinkNode>&) { ++steps; }));
    assert(steps == 6);

    auto fastNodes = MakeLinked({{"$A", "a"}, {"$B", "$A"}, {"$C", "$B"}});
    int fastSteps = 0;
    assert(!service.resolveAll(fastNodes, ResolutionMode::Fast, [&fastSteps](const std::vector<LinkNode>&) { ++fastSteps; }));
    assert(fastSteps == 3);
    std::cout << "[PASS] Step callback fires after every resolution step." << std::endl;
}

void TestInsertedUrlsAreNotRescanned() {
    // DOOR's short code happens to contain the name KEY.
    for (auto mode : {ResolutionMode::Fast, ResolutionMode::TwoPhase}) {
        auto registry = std::make_shared<RecordingRegistry>();
        registry->scriptedUrls = {"https://s.io/xKEYz", "https://s.io/q1", "https://s.io/r9"};
        ResolutionService service(registry, std::make_shared<IdentityEncoder>());
        auto nodes = MakeLinked({{"DOOR", "a door"}, {"KEY", "a key"}, {"ROOM", "open DOOR with KEY"}});

        assert(!service.resolveAll(nodes, mode));
        assert(*nodes[0].getUrl() == "https://s.io/xKEYz");
        assert(FinalText(*registry, nodes[2]) == "open https://s.io/xKEYz with https://s.io/q1");
    }

    // The longer of two overlapping names wins at a given position.
    auto registry = std::make_shared<RecordingRegistry>();
    registry->scriptedUrls = {"https://s.io/d", "https://s.io/d2", "https://s.io/h"};
    ResolutionService service(registry, std::make_shared<IdentityEncoder>());
    auto nodes = MakeLinked({{"DOOR", "a door"}, {"DOOR2", "another door"}, {"HALL", "DOOR2 then DOOR"}});
    assert(!service.resolveAll(nodes, ResolutionMode::Fast));
    assert(FinalText(*registry, nodes[2]) == "https://s.io/d2 then https://s.io/d");
    std::cout << "[PASS] Substitution never rewrites URLs it has inserted." << std::endl;
}

void TestUnlinkedNodesRejected() {
    ResolutionService service(std::make_shared<RecordingRegistry>(), std::make_shared<IdentityEncoder>());
    std::vector<LinkNode> nodes;
    nodes.emplace_back(test::QuestTarget(), "$A", "a");
    bool threw = false;
    try {
        service.resolveAll(nodes, ResolutionMode::TwoPhase);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unlinked node sets are rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ResolutionService Test..." << std::endl;
    TestCyclicTwoPhase();
    TestCyclicFastFails();
    TestFastStallsAfterPartialProgress();
    TestAcyclicScenario();
    TestEquivalenceOnAcyclicGraph();
    TestSelfLoop();
    TestPhaseOneSkipsExistingUrl();
    TestRegistryFailureAborts();
    TestStepCallback();
    TestInsertedUrlsAreNotRescanned();
    TestUnlinkedNodesRejected();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
