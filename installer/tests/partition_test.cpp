#include <gtest/gtest.h>
#include <stdexcept>
#include "errors.hpp"
#include "fake_system.hpp"
#include "partition.hpp"

using namespace bedrock;
using namespace bedrock::disk;
using bedrock::fake::FakeDisk;
using bedrock::fake::FakeSystem;

namespace {

template <typename Fn>
ErrorKind kind_of(Fn&& fn) {
    try {
        fn();
    } catch (const InstallError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected InstallError";
    return ErrorKind::InstallFailed;
}

}  // namespace

TEST(MakePlan, UefiHasEspThenRoot) {
    PartitionPlan plan = make_plan(FirmwareMode::UEFI);

    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0].index, 1);
    EXPECT_EQ(plan[0].type_code, "ef00");
    EXPECT_EQ(plan[0].label, "EFI");
    ASSERT_TRUE(plan[0].size_mib.has_value());
    EXPECT_EQ(*plan[0].size_mib, 512u);

    EXPECT_EQ(plan[1].index, 2);
    EXPECT_EQ(plan[1].type_code, "8300");
    EXPECT_EQ(plan[1].label, "ROOT");
    EXPECT_FALSE(plan[1].size_mib.has_value());
}

TEST(MakePlan, BiosIsOneWholeDiskPartition) {
    PartitionPlan plan = make_plan(FirmwareMode::BIOS);

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].index, 1);
    EXPECT_EQ(plan[0].type_code, "83");
    EXPECT_EQ(plan[0].label, "ROOT");
    EXPECT_FALSE(plan[0].size_mib.has_value());
    EXPECT_TRUE(plan[0].bootable);
}

TEST(MakePlan, HonoursOptions) {
    PartitionOptions options;
    options.efi_size_mib = 1024;
    options.efi_label = "ESP";
    options.root_label = "arch";

    PartitionPlan plan = make_plan(FirmwareMode::UEFI, options);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(*plan[0].size_mib, 1024u);
    EXPECT_EQ(plan[0].label, "ESP");
    EXPECT_EQ(plan[1].label, "arch");
}

TEST(CheckTools, UefiNeedsFatTools) {
    FakeSystem sys;
    sys.missing_tools = {"mkfs.fat"};

    EXPECT_EQ(kind_of([&] { check_tools(sys, FirmwareMode::UEFI); }), ErrorKind::ToolMissing);
    EXPECT_NO_THROW(check_tools(sys, FirmwareMode::BIOS));
}

TEST(CheckTools, BiosNeedsSfdisk) {
    FakeSystem sys;
    sys.missing_tools = {"sfdisk"};

    EXPECT_EQ(kind_of([&] { check_tools(sys, FirmwareMode::BIOS); }), ErrorKind::ToolMissing);
    EXPECT_NO_THROW(check_tools(sys, FirmwareMode::UEFI));
}

TEST(PartitionPlanner, UefiCommitsInPlanOrder) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    fake::attach(sys, sda);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    auto parts = planner.run(sda.device(), FirmwareMode::UEFI);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].path(), "/dev/sda1");
    EXPECT_EQ(parts[1].path(), "/dev/sda2");
    EXPECT_EQ(planner.state(), PlannerState::Rediscovered);

    int wipe = sys.index_of("wipefs --all --force /dev/sda");
    int zap = sys.index_of("sgdisk --zap-all /dev/sda");
    int table = sys.index_of("sgdisk -o /dev/sda");
    int efi = sys.index_of("sgdisk -n 1:0:+512M -t 1:ef00 -c 1:EFI /dev/sda");
    int root = sys.index_of("sgdisk -n 2:0:0 -t 2:8300 -c 2:ROOT /dev/sda");
    int probe = sys.index_of("partprobe /dev/sda");

    ASSERT_GE(wipe, 0);
    EXPECT_LT(wipe, zap);
    EXPECT_LT(zap, table);
    EXPECT_LT(table, efi);
    EXPECT_LT(efi, root);
    EXPECT_LT(root, probe);

    ASSERT_EQ(sys.settles.size(), 1u);
    EXPECT_EQ(sys.settles[0], std::chrono::seconds(2));
}

TEST(PartitionPlanner, BiosWritesDosLabel) {
    FakeSystem sys;
    FakeDisk sdb{"sdb", {"sdb1"}};
    fake::attach(sys, sdb);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    auto parts = planner.run(sdb.device(), FirmwareMode::BIOS);

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].path(), "/dev/sdb1");
    EXPECT_TRUE(sys.ran("printf 'label: dos\\n,,83,*\\n' | sfdisk --wipe always --wipe-partitions always /dev/sdb"));
    EXPECT_FALSE(sys.ran("sgdisk"));
}

TEST(PartitionPlanner, UsesKernelNamesForNvme) {
    FakeSystem sys;
    FakeDisk nvme{"nvme0n1", {"nvme0n1p1", "nvme0n1p2"}};
    fake::attach(sys, nvme);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    auto parts = planner.run(nvme.device(), FirmwareMode::UEFI);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].path(), "/dev/nvme0n1p1");
    EXPECT_EQ(parts[1].path(), "/dev/nvme0n1p2");
}

TEST(PartitionPlanner, FewerPartitionsThanPlannedIsFatal) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    fake::attach(sys, sda, 1);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    EXPECT_EQ(kind_of([&] { planner.run(sda.device(), FirmwareMode::UEFI); }),
              ErrorKind::DiscoveryMismatch);
    EXPECT_EQ(planner.state(), PlannerState::Committed);
}

TEST(PartitionPlanner, ExtraPartitionsAreIgnored) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2", "sda3"}};
    fake::attach(sys, sda);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    auto parts = planner.run(sda.device(), FirmwareMode::BIOS);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "sda1");
}

TEST(PartitionPlanner, WipeFailureStopsBeforePartitioning) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    fake::attach(sys, sda);
    sys.failing = {"wipefs"};
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    EXPECT_EQ(kind_of([&] { planner.run(sda.device(), FirmwareMode::UEFI); }),
              ErrorKind::DestructiveOpFailed);
    EXPECT_FALSE(sys.ran("sgdisk"));
    EXPECT_EQ(planner.state(), PlannerState::Unpartitioned);
}

TEST(PartitionPlanner, PartitionFailureStopsBeforeRediscovery) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    fake::attach(sys, sda);
    sys.failing = {"sgdisk -n 2"};
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    EXPECT_EQ(kind_of([&] { planner.run(sda.device(), FirmwareMode::UEFI); }),
              ErrorKind::DestructiveOpFailed);
    EXPECT_FALSE(sys.ran("partprobe"));
    EXPECT_EQ(planner.state(), PlannerState::Planned);
}

TEST(PartitionPlanner, TransitionsMustFollowOrder) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1"}};
    fake::attach(sys, sda);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    EXPECT_THROW(planner.build_plan(FirmwareMode::BIOS), std::logic_error);
    EXPECT_THROW(planner.commit(sda.device()), std::logic_error);
    EXPECT_THROW(planner.rediscover(sda.device()), std::logic_error);
    EXPECT_TRUE(sys.commands.empty());
}

TEST(PartitionPlanner, StepwiseTransitions) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1"}};
    fake::attach(sys, sda);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    planner.clear_table(sda.device());
    EXPECT_EQ(planner.state(), PlannerState::TableCleared);

    const PartitionPlan& plan = planner.build_plan(FirmwareMode::BIOS);
    EXPECT_EQ(plan.size(), 1u);
    EXPECT_EQ(planner.state(), PlannerState::Planned);

    planner.commit(sda.device());
    EXPECT_EQ(planner.state(), PlannerState::Committed);

    EXPECT_EQ(planner.rediscover(sda.device()).size(), 1u);
    EXPECT_EQ(planner.state(), PlannerState::Rediscovered);
}

TEST(PartitionPlanner, RerunReleasesPreviousMounts) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    sda.partitioned = true;
    sda.mounted = {{"sda2", "/mnt"}, {"sda1", "[SWAP]"}};
    fake::attach(sys, sda);
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    auto parts = planner.run(sda.device(), FirmwareMode::UEFI);

    EXPECT_EQ(parts.size(), 2u);
    EXPECT_TRUE(sys.ran("umount -R /mnt"));
    EXPECT_TRUE(sys.ran("swapoff /dev/sda1"));
    EXPECT_LT(sys.index_of("umount -R /mnt"), sys.index_of("wipefs"));
}

TEST(PartitionPlanner, BusyPartitionStopsBeforeWipe) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    sda.partitioned = true;
    sda.mounted = {{"sda2", "/mnt"}, {"sda1", "/mnt/boot"}};
    fake::attach(sys, sda);
    sys.failing = {"umount -R", "partprobe"};
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    try {
        planner.run(sda.device(), FirmwareMode::UEFI);
        FAIL() << "expected DestructiveOpFailed";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DestructiveOpFailed);
        EXPECT_EQ(e.device().rfind("/dev/sda", 0), 0u);
    }
    EXPECT_FALSE(sys.ran("wipefs"));
    EXPECT_FALSE(sys.ran("sgdisk"));
    EXPECT_FALSE(sys.ran("partprobe"));
    EXPECT_EQ(planner.state(), PlannerState::Unpartitioned);
}

TEST(PartitionPlanner, ActiveSwapStopsBeforeWipe) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1"}};
    sda.partitioned = true;
    sda.mounted = {{"sda1", "[SWAP]"}};
    fake::attach(sys, sda);
    sys.failing = {"swapoff"};
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    try {
        planner.clear_table(sda.device());
        FAIL() << "expected DestructiveOpFailed";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DestructiveOpFailed);
        EXPECT_EQ(e.device(), "/dev/sda1");
    }
    EXPECT_FALSE(sys.ran("wipefs"));
}

TEST(PartitionPlanner, ListingFailureAfterCommitIsDiscoveryMismatch) {
    FakeSystem sys;
    FakeDisk sda{"sda", {"sda1", "sda2"}};
    fake::attach(sys, sda);
    auto listing = sys.lsblk;
    sys.lsblk = [&sys, listing](const std::string& cmd) -> std::optional<std::string> {
        if (sys.ran("partprobe")) return std::nullopt;
        return listing(cmd);
    };
    DeviceCatalog catalog(sys);
    PartitionPlanner planner(sys, catalog);

    try {
        planner.run(sda.device(), FirmwareMode::UEFI);
        FAIL() << "expected DiscoveryMismatch";
    } catch (const InstallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DiscoveryMismatch);
        EXPECT_EQ(e.stage(), "partition rediscovery");
    }
    EXPECT_EQ(planner.state(), PlannerState::Committed);
}

TEST(Formatter, UefiLayout) {
    FakeSystem sys;
    Formatter formatter(sys);
    BlockDevice p1, p2;
    p1.name = "sda1";
    p2.name = "sda2";

    formatter.format_layout(FirmwareMode::UEFI, {p1, p2});

    EXPECT_TRUE(sys.ran("mkfs.fat -F32 -n EFI /dev/sda1"));
    EXPECT_TRUE(sys.ran("mkfs.ext4 -F -L ROOT /dev/sda2"));
    EXPECT_LT(sys.index_of("mkfs.fat"), sys.index_of("mkfs.ext4"));
}

TEST(Formatter, BiosLayout) {
    FakeSystem sys;
    Formatter formatter(sys);
    BlockDevice p1;
    p1.name = "sdb1";

    formatter.format_layout(FirmwareMode::BIOS, {p1});

    EXPECT_TRUE(sys.ran("mkfs.ext4 -F -L ROOT /dev/sdb1"));
    EXPECT_FALSE(sys.ran("mkfs.fat"));
}

TEST(Formatter, FailureStopsTheLayout) {
    FakeSystem sys;
    sys.failing = {"mkfs.fat"};
    Formatter formatter(sys);
    BlockDevice p1, p2;
    p1.name = "sda1";
    p2.name = "sda2";

    EXPECT_EQ(kind_of([&] { formatter.format_layout(FirmwareMode::UEFI, {p1, p2}); }),
              ErrorKind::DestructiveOpFailed);
    EXPECT_FALSE(sys.ran("mkfs.ext4"));
}

TEST(Formatter, TooFewPartitions) {
    FakeSystem sys;
    Formatter formatter(sys);
    BlockDevice p1;
    p1.name = "sda1";

    EXPECT_EQ(kind_of([&] { formatter.format_layout(FirmwareMode::UEFI, {p1}); }),
              ErrorKind::DiscoveryMismatch);
    EXPECT_TRUE(sys.commands.empty());
}
