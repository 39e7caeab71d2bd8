#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "bridge_manager.h"
#include "impairment_controller.h"
#include "test_fake_kernel.h"

class BridgeManagerTest : public ::testing::Test {
protected:
    BridgeManagerTest() : bridges(kernel, locks, "ip") {
        kernel.addDevice("eth1");
        kernel.addDevice("eth2");
        kernel.addDevice("eth3");
    }

    static bool isDelete(const std::vector<std::string>& argv) {
        return argv.size() > 2 && argv[1] == "link" && argv[2] == "delete";
    }

    FakeKernel kernel;
    DeviceLocks locks;
    BridgeManager bridges;
};

TEST_F(BridgeManagerTest, BuildsBridgeWithBothPortsUp) {
    BridgeResult result = bridges.reconcileBridge("br-wan1", "eth1", "eth2");
    ASSERT_TRUE(result.ok) << result.step << ": " << result.reason;

    ASSERT_TRUE(kernel.exists("br-wan1"));
    EXPECT_TRUE(kernel.device("br-wan1").up);
    EXPECT_EQ(kernel.device("eth1").master, "br-wan1");
    EXPECT_EQ(kernel.device("eth2").master, "br-wan1");
    EXPECT_TRUE(kernel.device("eth1").up);
    EXPECT_TRUE(kernel.device("eth2").up);
    EXPECT_TRUE(kernel.device("eth3").master.empty());
}

TEST_F(BridgeManagerTest, ReconcileIsIdempotent) {
    ASSERT_TRUE(bridges.reconcileBridge("br-wan1", "eth1", "eth2").ok);
    ASSERT_TRUE(bridges.reconcileBridge("br-wan1", "eth1", "eth2").ok);

    BridgeTopology topology = bridges.readBridgeTopology("br-wan1");
    EXPECT_TRUE(topology.exists);
    EXPECT_TRUE(topology.up);
    ASSERT_EQ(topology.members.size(), 2u);
    EXPECT_EQ(topology.members[0].name, "eth1");
    EXPECT_EQ(topology.members[1].name, "eth2");

    // second round rebuilt from scratch
    EXPECT_EQ(kernel.countMatching(isDelete), 1u);
}

TEST_F(BridgeManagerTest, PortIsPulledOutOfForeignBridge) {
    kernel.addBridge("br-old");
    kernel.enslave("eth1", "br-old");
    kernel.enslave("eth3", "br-old");

    ASSERT_TRUE(bridges.reconcileBridge("br-wan1", "eth1", "eth2").ok);

    EXPECT_EQ(kernel.device("eth1").master, "br-wan1");
    ASSERT_TRUE(kernel.exists("br-old"));
    EXPECT_EQ(kernel.device("eth3").master, "br-old");
    EXPECT_EQ(kernel.countMatching(isDelete), 0u);
}

TEST_F(BridgeManagerTest, CreateFailureStopsAndKeepsDiagnostic) {
    kernel.failOnToken("add", "RTNETLINK answers: Operation not permitted");

    BridgeResult result = bridges.reconcileBridge("br-wan1", "eth1", "eth2");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.step, "create");
    EXPECT_EQ(result.reason, "RTNETLINK answers: Operation not permitted");
    EXPECT_EQ(kernel.countMatching([](const std::vector<std::string>& argv) {
        return std::find(argv.begin(), argv.end(), "master") != argv.end();
    }), 0u);
}

TEST_F(BridgeManagerTest, AttachFailureStillFinishesTheRest) {
    kernel.failWhen([](const std::vector<std::string>& argv) {
        return argv.size() == 7 && argv[4] == "eth1" && argv[5] == "master";
    }, "RTNETLINK answers: Device or resource busy");

    BridgeResult result = bridges.reconcileBridge("br-wan1", "eth1", "eth2");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.step, "attach");
    EXPECT_EQ(result.reason, "eth1: RTNETLINK answers: Device or resource busy");

    EXPECT_EQ(kernel.device("eth2").master, "br-wan1");
    EXPECT_TRUE(kernel.device("br-wan1").up);
}

TEST_F(BridgeManagerTest, BestEffortStepsDoNotDecide) {
    kernel.failOnToken("nomaster", "RTNETLINK answers: Operation not supported");
    kernel.failOnToken("down", "RTNETLINK answers: Operation not permitted");

    EXPECT_TRUE(bridges.reconcileBridge("br-wan1", "eth1", "eth2").ok);
}

TEST_F(BridgeManagerTest, RejectsUnsafeOrOverlappingNames) {
    BridgeResult unsafe = bridges.reconcileBridge("br-wan1", "eth1;reboot", "eth2");
    EXPECT_EQ(unsafe.step, "validate");

    BridgeResult same = bridges.reconcileBridge("br-wan1", "eth1", "eth1");
    EXPECT_EQ(same.step, "validate");

    BridgeResult collide = bridges.reconcileBridge("eth1", "eth1", "eth2");
    EXPECT_EQ(collide.step, "validate");

    EXPECT_TRUE(kernel.history().empty());
}

TEST_F(BridgeManagerTest, DestroyAbsentBridgeIsNoop) {
    BridgeResult result = bridges.destroyBridge("br-wan9");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(kernel.countMatching(isDelete), 0u);
}

TEST_F(BridgeManagerTest, DestroyReleasesPorts) {
    ASSERT_TRUE(bridges.reconcileBridge("br-wan1", "eth1", "eth2").ok);
    EXPECT_TRUE(bridges.destroyBridge("br-wan1").ok);

    EXPECT_FALSE(kernel.exists("br-wan1"));
    EXPECT_TRUE(kernel.device("eth1").master.empty());
    EXPECT_TRUE(kernel.device("eth2").master.empty());

    BridgeTopology topology = bridges.readBridgeTopology("br-wan1");
    EXPECT_FALSE(topology.exists);
    EXPECT_TRUE(topology.members.empty());
}

TEST_F(BridgeManagerTest, DeleteFailureIsReported) {
    kernel.addBridge("br-wan1");
    kernel.failOnToken("delete", "RTNETLINK answers: Operation not permitted");

    BridgeResult result = bridges.destroyBridge("br-wan1");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.step, "delete");
    EXPECT_TRUE(kernel.exists("br-wan1"));
}

TEST_F(BridgeManagerTest, SameBridgeNeverReconcilesConcurrently) {
    ImpairmentController impairments(kernel, locks, "tc");
    kernel.setLatency(std::chrono::milliseconds(1));

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([this] {
            for (int round = 0; round < 3; ++round) {
                bridges.reconcileBridge("br-wan1", "eth1", "eth2");
            }
        });
    }
    workers.emplace_back([&impairments] {
        for (int round = 0; round < 6; ++round) {
            impairments.applyImpairment("eth1", 20, 0, 0, 0);
        }
    });
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_FALSE(kernel.sameDeviceOverlap());
    BridgeTopology topology = bridges.readBridgeTopology("br-wan1");
    EXPECT_TRUE(topology.exists);
    EXPECT_TRUE(topology.up);
    ASSERT_EQ(topology.members.size(), 2u);
    for (const auto& member : topology.members) {
        EXPECT_TRUE(member.up) << member.name;
    }
}
