#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "auth/approval_gate.h"

using namespace lumi;

#define FAIL()                                                          \
    do {                                                                \
        std::cerr << "approval_gate_test failed at " << __FILE__ << ":" \
                  << __LINE__ << "\n";                                  \
        return 1;                                                       \
    } while (false)

namespace {

std::filesystem::path TempDir(const std::string& name) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec) / name;
    if (ec) dir = std::filesystem::path{"."} / name;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

}  // namespace

int main() {
    const auto dir = TempDir("lumi_approval_gate_test");
    const auto store = dir / "approved_devices.json";

    {
        ApprovalGate gate(store);
        std::vector<PendingApproval> notified;
        gate.set_on_request([&](const PendingApproval& r) { notified.push_back(r); });

        // Unknown device is queued once, however often it probes.
        if (gate.check("Alice's iPhone", "10.0.0.5") != ApprovalStatus::pending) FAIL();
        assert(gate.check("Alice's iPhone", "10.0.0.5") == ApprovalStatus::pending);
        assert(gate.check("Alice's iPhone", "10.0.0.5") == ApprovalStatus::pending);
        assert(gate.pending().size() == 1);
        assert(notified.size() == 1);
        assert(notified[0].device_name == "Alice's iPhone");
        assert(notified[0].address == "10.0.0.5");

        // Approve: the next probe passes.
        assert(!gate.accept("no-such-id"));
        assert(gate.accept(notified[0].id));
        assert(gate.pending().empty());
        assert(gate.is_approved("Alice's iPhone"));
        assert(gate.check("Alice's iPhone", "10.0.0.5") == ApprovalStatus::approved);

        // Reject: reported once, then a later probe starts over.
        assert(gate.check("Bob's iPad", "10.0.0.6") == ApprovalStatus::pending);
        assert(notified.size() == 2);
        assert(gate.reject(notified[1].id));
        assert(gate.pending().empty());
        if (gate.check("Bob's iPad", "10.0.0.6") != ApprovalStatus::rejected) FAIL();
        assert(gate.check("Bob's iPad", "10.0.0.6") == ApprovalStatus::pending);
        assert(notified.size() == 3);
        assert(!gate.is_approved("Bob's iPad"));
    }

    // Approvals survive a restart.
    {
        ApprovalGate gate(store);
        assert(gate.is_approved("Alice's iPhone"));
        assert(gate.approved_devices().size() == 1);
        assert(gate.pending().empty());
        assert(gate.check("Alice's iPhone", "10.0.0.9") == ApprovalStatus::approved);

        gate.reset_paired_devices();
        assert(!gate.is_approved("Alice's iPhone"));
        assert(gate.check("Alice's iPhone", "10.0.0.9") == ApprovalStatus::pending);
    }

    // ...and so does the reset.
    {
        ApprovalGate gate(store);
        assert(gate.approved_devices().empty());
    }

    // Requests nobody answers expire and cannot be approved afterwards.
    {
        ApprovalGate gate({}, std::chrono::milliseconds(200));
        std::vector<PendingApproval> notified;
        gate.set_on_request([&](const PendingApproval& r) { notified.push_back(r); });

        assert(gate.check("Forgotten Phone", "10.0.0.7") == ApprovalStatus::pending);
        for (int i = 0; i < 20; ++i) gate.check("Scanner " + std::to_string(i), "10.0.0.8");
        assert(gate.pending().size() == 21);

        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        if (!gate.pending().empty()) FAIL();
        assert(!gate.accept(notified[0].id));
        assert(!gate.reject(notified[1].id));
        assert(!gate.is_approved("Forgotten Phone"));

        // Asking again opens a fresh request.
        assert(gate.check("Forgotten Phone", "10.0.0.7") == ApprovalStatus::pending);
        assert(notified.size() == 22);
        assert(notified.back().id != notified[0].id);
        assert(gate.accept(notified.back().id));
        assert(gate.check("Forgotten Phone", "10.0.0.7") == ApprovalStatus::approved);
    }

    // In-memory gate never touches disk.
    {
        ApprovalGate gate;
        assert(gate.check("X", "1.2.3.4") == ApprovalStatus::pending);
        assert(gate.accept(gate.pending().front().id));
        assert(gate.is_approved("X"));
    }

    std::cout << "approval_gate_test passed\n";
    return 0;
}
