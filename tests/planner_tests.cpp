// Transfer planner tests against the in-memory remote (run via CTest).
#include "TestSupport.hpp"
#include "rdispatch/LocalSource.hpp"
#include "rdispatch/MockRemoteSession.hpp"
#include "rdispatch/PathUtils.hpp"
#include "rdispatch/TransferPlanner.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using rdispatch::DispatchError;
using rdispatch::ErrorKind;
using rdispatch::FileMapping;
using rdispatch::MockRemoteSession;
using rdispatch::RemoteEntryState;
using rdispatch::SourceKind;
using rdispatch::SourceSpec;
using rdispatch::TransferPlan;
using rdispatch::TransferPlanner;
using testsupport::ScopedCwd;
using testsupport::TempTree;
using testsupport::TestContext;

namespace {

void connectMock(TestContext &t, MockRemoteSession &m) {
    rdispatch::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    DispatchError err;
    std::string cerr;
    t.check(m.connect(opt, err), "mock connect should succeed");
    t.check(m.openFileChannel(cerr), "mock file channel should open");
    m.resetCallLog();
}

SourceSpec resolved(TestContext &t, const std::string &source) {
    SourceSpec spec;
    DispatchError err;
    t.check(rdispatch::resolveSource(source, spec, err),
            "resolveSource('" + source + "') should succeed: " + err.describe());
    return spec;
}

// a/x.txt, a/b/y.txt
void makeScenarioTree(const TempTree &tree) {
    tree.file("a/x.txt", "xx");
    tree.file("a/b/y.txt", "yyy");
}

void test_end_to_end_absent_destination(TestContext &t) {
    TempTree tree("e2e-absent");
    makeScenarioTree(tree);
    ScopedCwd cwd(tree.path());

    MockRemoteSession remote;
    remote.seedDirectory("/remote");
    connectMock(t, remote);

    const SourceSpec spec = resolved(t, "a");
    t.check(spec.kind == SourceKind::Directory, "'a' should resolve to a directory");

    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(planner.buildPlan(spec, "/remote/d", plan, err),
            "plan for absent destination should succeed: " + err.describe());

    const std::vector<std::string> dirs{"/remote/d", "/remote/d/b"};
    t.check(plan.directories == dirs, "creation list should be [/remote/d, /remote/d/b]");
    const std::vector<FileMapping> files{{"a/x.txt", "/remote/d/x.txt"},
                                         {"a/b/y.txt", "/remote/d/b/y.txt"}};
    t.check(plan.files == files, "file mappings should follow the scenario");
    t.check(remote.probeCount() == 1, "only the destination should be probed");
    t.check(remote.probeCountFor("/remote/d/b") == 0,
            "child of a scheduled root should inherit without a probe");
}

void test_end_to_end_type_conflict(TestContext &t) {
    TempTree tree("e2e-conflict");
    makeScenarioTree(tree);
    ScopedCwd cwd(tree.path());

    MockRemoteSession remote;
    remote.seedDirectory("/remote/d");
    remote.seedFile("/remote/d/b", "not a dir");
    connectMock(t, remote);

    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(!planner.reconcileDirectory("a", "/remote/d", plan, err),
            "reconciling onto a file where a directory is needed should fail");
    t.checkKind(err, ErrorKind::TypeMismatch, "conflict should be a TypeMismatch");
    t.checkContains(err.message, "a/b", "message should name the local path");
    t.checkContains(err.message, "/remote/d/b", "message should name the remote path");
    t.check(remote.uploads().empty() && remote.createdDirectories().empty(),
            "planning must not mutate the remote side");
}

void test_failed_plan_is_discarded(TestContext &t) {
    TempTree tree("discard");
    makeScenarioTree(tree);
    ScopedCwd cwd(tree.path());

    MockRemoteSession remote;
    remote.seedDirectory("/remote/d/a");
    remote.seedFile("/remote/d/a/b");
    connectMock(t, remote);

    TransferPlan plan;
    plan.addDirectory("/sentinel");
    DispatchError err;
    TransferPlanner planner(remote);
    t.check(!planner.buildPlan(resolved(t, "a"), "/remote/d", plan, err),
            "buildPlan should fail on a type conflict below the effective root");
    t.checkKind(err, ErrorKind::TypeMismatch, "buildPlan conflict kind");
    t.check(plan.directories.size() == 1 && plan.directories[0] == "/sentinel" &&
                plan.files.empty(),
            "output plan should be left untouched on failure");
}

void test_counts_and_idempotence(TestContext &t) {
    TempTree tree("counts");
    tree.file("t/f1");
    tree.file("t/f2");
    tree.file("t/s1/f3");
    tree.file("t/s1/s2/f4");
    tree.file("t/s1/s2/f5");
    tree.dir("t/s3");
    const std::string local = tree.path("t");

    MockRemoteSession remote;
    connectMock(t, remote);
    TransferPlanner planner(remote);

    TransferPlan first;
    DispatchError err;
    t.check(planner.reconcileDirectory(local, "/dst", first, err),
            "first plan should succeed: " + err.describe());
    t.check(first.directories.size() == 4, "absent root: root plus 3 subdirectories");
    t.check(first.files.size() == 5, "every local file should be mapped");
    t.check(rdispatch::executePlan(first, remote, err),
            "executing the plan on the mock should succeed: " + err.describe());
    t.check(remote.hasFile("/dst/s1/s2/f5"), "deep file should be uploaded");
    t.check(remote.hasDirectory("/dst/s3"), "empty directory should be created");

    TransferPlan second;
    t.check(planner.reconcileDirectory(local, "/dst", second, err),
            "replanning a mirrored tree should succeed");
    t.check(second.directories.empty(), "mirrored destination needs no directories");
    t.check(second.files.size() == 5, "file count does not depend on remote state");
}

void test_partial_existence_count(TestContext &t) {
    TempTree tree("partial");
    tree.file("t/s1/s2/f");
    tree.dir("t/s3");
    const std::string local = tree.path("t");

    MockRemoteSession remote;
    remote.seedDirectory("/dst/s1");
    connectMock(t, remote);

    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(planner.reconcileDirectory(local, "/dst", plan, err),
            "partial plan should succeed: " + err.describe());
    const std::vector<std::string> dirs{"/dst/s1/s2", "/dst/s3"};
    t.check(plan.directories == dirs, "only missing directories are scheduled");
}

void test_round_trip_minimization(TestContext &t) {
    TempTree tree("roundtrip");
    tree.dir("t/p/s1");
    tree.dir("t/p/s2");
    const std::string local = tree.path("t");

    {
        MockRemoteSession remote;
        remote.seedDirectory("/dst");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.reconcileDirectory(local, "/dst", plan, err),
                "round-trip plan should succeed");
        t.check(remote.probeCountFor("/dst/p") == 1, "absent parent probed exactly once");
        t.check(remote.probeCountFor("/dst/p/s1") == 0 && remote.probeCountFor("/dst/p/s2") == 0,
                "siblings under an absent parent are not probed");
        t.check(remote.probeCount() == 2, "root + parent only");
        const std::vector<std::string> dirs{"/dst/p", "/dst/p/s1", "/dst/p/s2"};
        t.check(plan.directories == dirs, "parent then siblings in creation order");
    }
    {
        MockRemoteSession remote;
        remote.seedDirectory("/dst/p");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.reconcileDirectory(local, "/dst", plan, err),
                "plan with existing parent should succeed");
        t.check(remote.probeCountFor("/dst/p/s1") == 1 && remote.probeCountFor("/dst/p/s2") == 1,
                "children of an existing parent are each probed");
        t.check(plan.directories.size() == 2, "both siblings are missing");
    }
}

void test_single_file(TestContext &t) {
    TempTree tree("single");
    tree.file("f.txt", "hello");
    const std::string local = tree.path("f.txt");

    MockRemoteSession remote;
    remote.seedDirectory("/up");
    connectMock(t, remote);
    TransferPlanner planner(remote);

    const SourceSpec spec = resolved(t, local);
    t.check(spec.kind == SourceKind::SingleFile, "regular file resolves to SingleFile");

    TransferPlan intoDir;
    DispatchError err;
    t.check(planner.buildPlan(spec, "/up", intoDir, err), "file into directory should plan");
    t.check(intoDir.directories.empty(), "single file never schedules directories");
    t.check(intoDir.files.size() == 1 && intoDir.files[0].remote_path == "/up/f.txt",
            "existing directory destination gets the basename appended");

    TransferPlan renamed;
    t.check(planner.buildPlan(spec, "/up/renamed.txt", renamed, err), "rename should plan");
    t.check(renamed.files.size() == 1 && renamed.files[0].remote_path == "/up/renamed.txt",
            "non-directory destination is used verbatim");
}

void test_directory_into_existing_destination(TestContext &t) {
    TempTree tree("dir-existing");
    tree.file("t/f");
    tree.file("t/s/g");

    MockRemoteSession remote;
    remote.seedDirectory("/dst");
    connectMock(t, remote);
    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(planner.buildPlan(resolved(t, tree.path("t")), "/dst", plan, err),
            "directory into existing destination should plan");
    const std::vector<std::string> dirs{"/dst/t", "/dst/t/s"};
    t.check(plan.directories == dirs, "effective root is destination/basename(source)");
    t.check(plan.files.size() == 2 && plan.files[0].remote_path == "/dst/t/f",
            "files land under the effective root");
}

void test_dot_sources_use_real_directory_name(TestContext &t) {
    TempTree tree("dot-sources");
    tree.file("proj/f.txt");
    tree.file("proj/sub/g.txt");
    ScopedCwd cwd(tree.path("proj/sub"));

    t.check(rdispatch::localBaseName("..") == "proj", "'..' is named after its directory");
    t.check(rdispatch::localBaseName(".") == "sub", "'.' is named after its directory");

    {
        MockRemoteSession remote;
        remote.seedDirectory("/remote/d");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.buildPlan(resolved(t, ".."), "/remote/d", plan, err),
                "parent directory source should plan: " + err.describe());
        const std::vector<std::string> dirs{"/remote/d/proj", "/remote/d/proj/sub"};
        t.check(plan.directories == dirs, "'..' lands under destination/proj");
        t.check(plan.files.size() == 2 && plan.files[0].remote_path == "/remote/d/proj/f.txt",
                "files stay inside the destination");
        t.check(rdispatch::executePlan(plan, remote, err), "executing the plan should succeed");
        t.check(!remote.hasFile("/remote/f.txt"), "nothing is written above the destination");
        t.check(remote.hasFile("/remote/d/proj/sub/g.txt"), "nested file uploaded in place");
    }
    {
        MockRemoteSession remote;
        remote.seedDirectory("/remote/d");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.buildPlan(resolved(t, "."), "/remote/d", plan, err),
                "current directory source should plan: " + err.describe());
        const std::vector<std::string> dirs{"/remote/d/sub"};
        t.check(plan.directories == dirs, "'.' lands under destination/sub");
        t.check(plan.files.size() == 1 && plan.files[0].remote_path == "/remote/d/sub/g.txt",
                "file of the current directory is mapped under its name");
    }
}

void test_directory_onto_remote_file(TestContext &t) {
    TempTree tree("dir-onto-file");
    tree.file("t/f");

    MockRemoteSession remote;
    remote.seedFile("/dst");
    connectMock(t, remote);
    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(!planner.buildPlan(resolved(t, tree.path("t")), "/dst", plan, err),
            "directory onto a remote file should fail");
    t.checkKind(err, ErrorKind::TypeMismatch, "root conflict kind");
}

void test_pattern_sources(TestContext &t) {
    TempTree tree("pattern");
    tree.file("g/a.txt");
    tree.file("g/b.txt");
    tree.file("g/sub/c.txt");
    tree.dir("g/sub/deeper");
    const std::string pattern = tree.path("g") + "/*";

    const SourceSpec spec = resolved(t, pattern);
    t.check(spec.kind == SourceKind::Pattern, "glob should resolve to Pattern");
    t.check(spec.matches.size() == 3, "glob should match 3 entries");

    {
        MockRemoteSession remote;
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.buildPlan(spec, "/out", plan, err),
                "pattern into absent destination should plan: " + err.describe());
        const std::vector<std::string> dirs{"/out", "/out/sub", "/out/sub/deeper"};
        t.check(plan.directories == dirs, "destination scheduled first, then match subtree");
        const std::vector<FileMapping> files{{tree.path("g/a.txt"), "/out/a.txt"},
                                             {tree.path("g/b.txt"), "/out/b.txt"},
                                             {tree.path("g/sub/c.txt"), "/out/sub/c.txt"}};
        t.check(plan.files == files, "file matches land side by side in the destination");
        t.check(remote.probeCount() == 1, "only the destination is probed when it is absent");
    }
    {
        MockRemoteSession remote;
        remote.seedDirectory("/out/sub");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(planner.buildPlan(spec, "/out", plan, err), "pattern into existing destination");
        const std::vector<std::string> dirs{"/out/sub/deeper"};
        t.check(plan.directories == dirs, "existing destination and match root are not scheduled");
    }
    {
        MockRemoteSession remote;
        remote.seedFile("/out");
        connectMock(t, remote);
        TransferPlanner planner(remote);
        TransferPlan plan;
        DispatchError err;
        t.check(!planner.buildPlan(spec, "/out", plan, err), "pattern onto a remote file fails");
        t.checkKind(err, ErrorKind::TypeMismatch, "pattern destination conflict kind");
    }
}

void test_empty_pattern(TestContext &t) {
    TempTree tree("empty-pattern");
    tree.dir("g");
    SourceSpec spec;
    DispatchError err;
    t.check(!rdispatch::resolveSource(tree.path("g") + "/*.none", spec, err),
            "empty glob should fail");
    t.checkKind(err, ErrorKind::SourceNotFound, "empty glob kind");

    err.clear();
    t.check(!rdispatch::resolveSource(tree.path("missing.txt"), spec, err),
            "missing literal path should fail");
    t.checkKind(err, ErrorKind::SourceNotFound, "missing literal kind");
}

void test_requires_recursive(TestContext &t) {
    TempTree tree("recursive");
    tree.file("one/only.txt");
    tree.file("two/a.txt");
    tree.file("two/b.txt");
    tree.dir("dirs/sub");

    t.check(!rdispatch::requiresRecursive(resolved(t, tree.path("one/only.txt"))),
            "single file needs no flag");
    t.check(rdispatch::requiresRecursive(resolved(t, tree.path("two"))),
            "directory needs the flag");
    t.check(rdispatch::requiresRecursive(resolved(t, tree.path("two") + "/*.txt")),
            "pattern with two matches needs the flag");
    t.check(!rdispatch::requiresRecursive(resolved(t, tree.path("one") + "/*.txt")),
            "pattern with one file match needs no flag");
    t.check(rdispatch::requiresRecursive(resolved(t, tree.path("dirs") + "/*")),
            "pattern whose single match is a directory needs the flag");
}

void test_probe_failure(TestContext &t) {
    TempTree tree("probe-failure");
    tree.dir("t/p");

    MockRemoteSession remote;
    remote.seedDirectory("/dst");
    remote.failProbeOn("/dst/p");
    connectMock(t, remote);
    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(!planner.reconcileDirectory(tree.path("t"), "/dst", plan, err),
            "probe failure should abort planning");
    t.checkKind(err, ErrorKind::Probe, "probe failure kind");
    t.checkContains(err.message, "/dst/p", "probe error names the path");
}

void test_symlinked_directory_not_descended(TestContext &t) {
    TempTree tree("symlink");
    tree.file("t/real/inner.txt");
    std::error_code ec;
    std::filesystem::create_directory_symlink(tree.path("t/real"), tree.path("t/link"), ec);
    if (ec) {
        std::cout << "[SKIP] symlinks unavailable: " << ec.message() << "\n";
        return;
    }

    MockRemoteSession remote;
    connectMock(t, remote);
    TransferPlanner planner(remote);
    TransferPlan plan;
    DispatchError err;
    t.check(planner.reconcileDirectory(tree.path("t"), "/dst", plan, err),
            "tree with a symlinked directory should plan");
    const std::vector<std::string> dirs{"/dst", "/dst/real", "/dst/link"};
    t.check(plan.directories == dirs, "symlinked directory is created");
    t.check(plan.files.size() == 1, "symlinked directory contents are not mapped");
}

void test_probe_queries(TestContext &t) {
    MockRemoteSession remote;
    remote.seedDirectory("/srv/data");
    remote.seedFile("/srv/data/file.bin");
    connectMock(t, remote);

    std::string err;
    t.check(remote.exists("/srv/data", err) && remote.isDirectory("/srv/data", err),
            "seeded directory exists and is a directory");
    t.check(remote.exists("/srv/data/file.bin", err) &&
                !remote.isDirectory("/srv/data/file.bin", err),
            "seeded file exists and is not a directory");
    t.check(!remote.exists("/srv/none", err) && err.empty(),
            "missing path is a normal answer, not an error");

    remote.failProbeOn("/srv/broken");
    t.check(!remote.exists("/srv/broken", err) && !err.empty(),
            "failed query reports an error");

    remote.closeFileChannel();
    err.clear();
    RemoteEntryState st = RemoteEntryState::Absent;
    t.check(!remote.probe("/srv/data", st, err), "probe needs the file channel");
    t.checkContains(err, "File channel not open", "closed channel error");
}

void test_wide_skeleton_scales_linearly(TestContext &t) {
    constexpr int kDirs = 200000;
    TransferPlan plan;
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kDirs; ++i)
        plan.addDirectory("/dst/d" + std::to_string(i));
    for (int i = 0; i < kDirs; i += 7)
        plan.addDirectory("/dst/d" + std::to_string(i));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    t.check(plan.directories.size() == static_cast<std::size_t>(kDirs),
            "repeated directories are listed once");
    t.check(plan.directories.front() == "/dst/d0" && plan.directories.back() == "/dst/d199999",
            "first-occurrence order is kept");
    t.check(elapsed < std::chrono::seconds(10),
            "scheduling a wide skeleton must not be quadratic in its size");

    TempTree tree("wide");
    for (int i = 0; i < 500; ++i)
        tree.dir("t/d" + std::to_string(i));
    MockRemoteSession remote;
    connectMock(t, remote);
    TransferPlanner planner(remote);
    TransferPlan wide;
    DispatchError err;
    t.check(planner.reconcileDirectory(tree.path("t"), "/wide", wide, err),
            "wide tree should plan: " + err.describe());
    t.check(wide.directories.size() == 501, "root plus every sibling directory");
    t.check(remote.probeCount() == 1, "siblings under a scheduled root are not probed");
}

void test_path_helpers(TestContext &t) {
    using rdispatch::joinRemotePath;
    using rdispatch::normalizeRemotePath;
    t.check(normalizeRemotePath("/remote//d/") == "/remote/d", "collapse and trim");
    t.check(normalizeRemotePath("/a/./b/../c") == "/a/c", "dot components");
    t.check(normalizeRemotePath("/..") == "/", "root parent is root");
    t.check(normalizeRemotePath("rel/../x") == "x", "relative paths stay relative");
    t.check(joinRemotePath("/", "x") == "/x", "join at root");
    t.check(joinRemotePath("/a", "x") == "/a/x", "join adds a separator");
    t.check(rdispatch::localBaseName("dir/sub/") == "sub", "basename ignores trailing slash");
}

} // namespace

int main() {
    TestContext t;
    test_end_to_end_absent_destination(t);
    test_end_to_end_type_conflict(t);
    test_failed_plan_is_discarded(t);
    test_counts_and_idempotence(t);
    test_partial_existence_count(t);
    test_round_trip_minimization(t);
    test_single_file(t);
    test_directory_into_existing_destination(t);
    test_dot_sources_use_real_directory_name(t);
    test_directory_onto_remote_file(t);
    test_pattern_sources(t);
    test_empty_pattern(t);
    test_requires_recursive(t);
    test_probe_failure(t);
    test_symlinked_directory_not_descended(t);
    test_probe_queries(t);
    test_wide_skeleton_scales_linearly(t);
    test_path_helpers(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] rdispatch_planner_tests\n";
    return EXIT_SUCCESS;
}
