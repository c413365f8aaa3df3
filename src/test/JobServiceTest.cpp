#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include "application/AsyncTaskManager.hpp"
#include "application/JobAdmissionService.hpp"
#include "application/JobClosureService.hpp"
#include "application/JobService.hpp"
#include "application/StatusTransitionService.hpp"
#include "application/WorkspaceService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileJobRepository.hpp"
#include "infrastructure/FileLockService.hpp"
#include "infrastructure/LocalCollaborators.hpp"

using namespace jobledger::domain;
using namespace jobledger::application;
using namespace jobledger::infrastructure;

namespace fs = std::filesystem;

// Records notifications instead of sending them.
class RecordingNotifier : public CompletionNotifier {
public:
    void notify(const std::vector<std::string>& recipients,
                const std::string& subject,
                const std::vector<std::string>& lines) override {
        this->recipients = recipients;
        this->subject = subject;
        this->lines = lines;
        calls++;
    }

    std::vector<std::string> recipients;
    std::string subject;
    std::vector<std::string> lines;
    int calls = 0;
};

// Counts calls and never offers a workspace.
class CountingValidator : public WorkspaceValidator {
public:
    std::optional<std::string> validate(const std::string&, const std::optional<std::string>&) override {
        calls++;
        return std::nullopt;
    }

    int calls = 0;
};

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static bool Contains(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

static void Touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << "%PDF";
}

int main() {
    std::cout << "[Test] Starting Job Service Test..." << std::endl;

    fs::path testRoot = fs::absolute("test_root_jobservice");
    fs::remove_all(testRoot);
    fs::path jobsDir = testRoot / "jobs";
    fs::path workspaces = testRoot / "work";
    fs::create_directories(jobsDir);
    fs::create_directories(workspaces / "105000");
    fs::create_directories(testRoot / "issued" / "105000");

    auto repo = std::make_shared<FileJobRepository>(jobsDir);
    auto locks = std::make_shared<FileLockService>(jobsDir);
    auto validator = std::make_shared<DirectoryWorkspaceValidator>(workspaces);
    auto alice = std::make_shared<JobService>(repo, locks, "alice", validator);
    JobService bob(repo, locks, "bob");

    // Checkout
    assert(Throws<NotFoundError>([&] { alice->checkout("105000"); }));
    alice->createJob("105000", std::nullopt);
    {
        JobCheckout checkout = alice->checkout("105000");
        assert(checkout.held());
        assert(checkout.job().workspace().value() == (workspaces / "105000").string());
        assert(fs::is_directory(workspaces / "105000" / "Rotating" / "Shafts"));
        assert(bob.read("105000").workspace() == checkout.job().workspace());

        try {
            bob.checkout("105000");
            assert(false && "checkout of a locked job must fail");
        } catch (const InUseError& e) {
            assert(e.owner() == "alice");
            assert(e.kind() == ErrorKind::InUse);
        }

        checkout.job().addProject("105000-177-43-01", "Shaft", "alice", "01/01/2020");
        checkout.job().addProject("105000-177-43-02", "Case", "bob", "02/01/2020");
        checkout.job().addProject("105000.9", "Alias only", "bob", "03/01/2020");
        alice->save(checkout);
    }
    assert(!alice->lockOwner("105000"));
    assert(bob.read("105000").projects().size() == 3);
    std::cout << "[PASS] Checkout, InUse and release on scope exit" << std::endl;

    // A reachable workspace is kept even when its folder is not named after the job.
    {
        fs::path vault = testRoot / "vault" / "Job 106000 Acme";
        fs::create_directories(vault);
        fs::create_directories(workspaces / "106000");
        alice->createJob("106000", vault.string());

        auto counting = std::make_shared<CountingValidator>();
        JobService carol(repo, locks, "carol", counting);
        {
            JobCheckout checkout = carol.checkout("106000");
            assert(checkout.job().workspace().value() == vault.string());
        }
        assert(counting->calls == 0);

        {
            JobCheckout checkout = alice->checkout("106000");
            assert(checkout.job().workspace().value() == vault.string());
        }
        assert(bob.read("106000").workspace().value() == vault.string());

        // Once it is gone the validator supplies the fallback.
        fs::remove_all(vault);
        {
            JobCheckout checkout = carol.checkout("106000");
            assert(checkout.job().workspace().value() == vault.string());
        }
        assert(counting->calls == 1);
        {
            JobCheckout checkout = alice->checkout("106000");
            assert(checkout.job().workspace().value() == (workspaces / "106000").string());
            alice->destroy(checkout);
        }
    }
    std::cout << "[PASS] Accessible workspace left untouched" << std::endl;

    // Moving a checkout transfers the grant.
    {
        JobCheckout first = alice->checkout("105000");
        JobCheckout second = std::move(first);
        assert(!first.held() && second.held());
        assert(alice->lockOwner("105000").value() == "alice");
    }
    assert(!alice->lockOwner("105000"));

    // Saving after losing the lock
    {
        JobCheckout checkout = alice->checkout("105000");
        assert(locks->release("alice", "105000"));
        assert(locks->acquire("bob", "105000").held());
        checkout.job().project("105000.9").setOwner("mallory");
        try {
            alice->save(checkout);
            assert(false && "save without the lock must fail");
        } catch (const SecurityViolationError& e) {
            assert(e.kind() == ErrorKind::SecurityViolation);
        }
        assert(bob.read("105000").project("105000.9").owner() == "bob");
        checkout.release();
        assert(alice->lockOwner("105000").value() == "bob");
        assert(locks->release("bob", "105000"));
    }
    std::cout << "[PASS] SecurityViolation when the lock was lost" << std::endl;

    // Selection
    assert(JobService::JobIdForSelection({"105000-177-43-01", "105000.9"}) == "105000");
    assert(Throws<AmbiguousSelectionError>([] { JobService::JobIdForSelection({"105000.1", "200000.1"}); }));
    assert(Throws<AmbiguousSelectionError>([] { JobService::JobIdForSelection({}); }));
    std::cout << "[PASS] Job selection" << std::endl;

    // Admission worker
    auto tasks = std::make_shared<AsyncTaskManager>();
    JobAdmissionService admission(alice, tasks);
    std::vector<AdmissionEntry> entries = {
        {"105000.20", "Existing job", "01/01/2021", "alice"},
        {"300000.1", "Impeller", "01/10/2021", "alice"},
        {"300000-1-2-3", "Disk", "01/11/2021", "bob"},
        {"400000.1", "Bad date", "someday", "bob"},
    };
    auto result = std::make_shared<AdmissionResult>();
    auto status = admission.submit(entries, result);
    tasks->WaitAll();
    assert(status->isCompleted && !status->failed);
    assert(result->admitted.size() == 1 && result->admitted[0] == "300000");
    assert(result->skipped.size() == 1 && result->skipped[0] == "105000");
    assert(result->failed.count("400000") == 1);
    assert(bob.read("300000").projects().size() == 2);
    assert(!alice->lockOwner("300000"));
    assert(!bob.read("105000").hasProject("105000.20"));
    std::cout << "[PASS] Background admission" << std::endl;

    // Text in a legacy encoding does not abort the batch.
    {
        std::vector<AdmissionEntry> latin1 = {
            {"500000.1", "Bore", "01/10/2021", "Jos\xe9"},
            {"600000.1", "Face", "01/10/2021", "bob"},
        };
        AdmissionResult admitted = admission.admit(latin1);
        assert(admitted.admitted.size() == 2 && admitted.failed.empty());
        assert(bob.read("500000").project("500000.1").owner() == "Jos\xEF\xBF\xBD");
        assert(bob.read("600000").projects().size() == 1);
    }
    std::cout << "[PASS] Invalid UTF-8 stored with replacement characters" << std::endl;

    // Destroying the service waits for its queued batch.
    {
        auto batch = std::make_shared<AdmissionResult>();
        std::shared_ptr<TaskStatus> queued;
        {
            JobAdmissionService shortLived(alice, std::make_shared<AsyncTaskManager>());
            queued = shortLived.submit(std::vector<AdmissionEntry>{{"700000.1", "Drill", "01/10/2021", "bob"}}, batch);
        }
        assert(queued->isCompleted);
        assert(batch->admitted.size() == 1 && batch->admitted[0] == "700000");
        assert(!alice->lockOwner("700000"));
    }
    std::cout << "[PASS] Admission service outlives its batches" << std::endl;

    // Closing
    Touch(workspaces / "105000" / "Rotating" / "Shafts" / "105000-177-43-01_rev2.pdf");
    Touch(workspaces / "105000" / "Layouts" / "layout.pdf");
    auto notifier = std::make_shared<RecordingNotifier>();
    auto transitions = std::make_shared<StatusTransitionService>(
        std::make_shared<DirectoryDestinationResolver>(testRoot / "issued"), ".pdf");
    JobClosureService closure(alice, transitions, notifier, {"shop@example.com"});
    {
        JobCheckout checkout = alice->checkout("105000");
        auto report = transitions->apply(checkout.job(), {"105000-177-43-01"}, ProjectStatus::Completed);
        assert(report.moved.size() == 1);
        alice->save(checkout);

        ClosureReport closed = closure.closeJob(checkout);
        assert(!checkout.held());
        assert(closed.drawingCount == 2);
        assert(closed.incompleteCount == 1);
        assert(closed.movedDocuments == 1);
        assert(closed.latestDueDate == "03/01/2020");
        assert(closed.filesRemoved == 2);
    }
    assert(!alice->jobExists("105000"));
    assert(fs::exists(testRoot / "issued" / "105000" / "layout.pdf"));
    assert(notifier->calls == 1);
    assert(notifier->recipients.size() == 1);
    assert(notifier->subject == "Job 105000 closed");
    assert(Contains(notifier->lines, "Incomplete drawings: 1"));
    assert(Contains(notifier->lines, "Latest due date: 03/01/2020"));
    std::cout << "[PASS] Close job" << std::endl;

    // Closing without a destination leaves the job in place.
    {
        JobCheckout checkout = alice->checkout("300000");
        assert(Throws<DestinationUnresolvedError>([&] { closure.closeJob(checkout); }));
        assert(checkout.held());
    }
    assert(alice->jobExists("300000"));
    assert(notifier->calls == 1);
    std::cout << "[PASS] Close aborted by unresolved destination" << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
