#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/Errors.hpp"
#include "domain/Job.hpp"
#include "domain/NoteLog.hpp"
#include "domain/ProjectKey.hpp"
#include "domain/ProjectStatus.hpp"
#include "domain/Schedule.hpp"

using namespace jobledger::domain;

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static void TestCalendarDate() {
    std::cout << "[Test] CalendarDate..." << std::endl;
    auto d = CalendarDate::Parse("1/5/2020");
    assert(d && d->toString() == "01/05/2020");
    assert(!CalendarDate::Parse("2020-01-05"));
    assert(!CalendarDate::Parse("02/30/2021"));
    assert(!CalendarDate::Parse(""));
    assert(CalendarDate::Parse("02/29/2020"));

    CalendarDate jan1(2020, 1, 1);
    CalendarDate mar1(2020, 3, 1);
    assert(mar1.daysSince(jan1) == 60);
    assert(jan1.daysSince(mar1) == -60);
    assert(jan1 < mar1);
    assert(Throws<std::invalid_argument>([] { CalendarDate::ParseOrThrow("13/01/2020"); }));
    std::cout << "[PASS] CalendarDate" << std::endl;
}

static void TestStatusAndKeys() {
    std::cout << "[Test] Status names and key shapes..." << std::endl;
    for (auto status : kAllStatuses) {
        assert(StatusFromString(StatusToString(status)) == status);
    }
    assert(IsTerminal(ProjectStatus::Completed));
    assert(!IsTerminal(ProjectStatus::AtReview));
    assert(Throws<std::invalid_argument>([] { StatusFromString("Done"); }));

    assert(IsValidJobId("105000"));
    assert(!IsValidJobId("10500"));
    assert(!IsValidJobId("10500a"));
    assert(JobIdFromKey("105000.177-43") == "105000");
    assert(IsDrawingNumber("105000-177-43-01"));
    assert(!IsDrawingNumber("105000.177-43"));

    auto drawings = DrawingNumbersIn({"105000-1-2-3", "105000.7", "105000-4-5-6"});
    assert(drawings.size() == 2 && drawings[1] == "105000-4-5-6");
    std::cout << "[PASS] Status names and key shapes" << std::endl;
}

static void TestNoteLog() {
    std::cout << "[Test] NoteLog..." << std::endl;
    NoteLog log("Machine per print");
    assert(log.size() == 1);
    assert(log.workInstructions() == "Machine per print");

    auto when = std::chrono::system_clock::now();
    std::string first = log.add("Material on order", "Brandon", when);
    std::string second = log.add("Material arrived", "Brandon", when);
    assert(first != second);
    assert(second == first + " #2");
    assert(log.entries().back().text == "Material arrived");
    assert(log.find(first).value() == "Material on order");

    assert(Throws<std::invalid_argument>([] { NoteLog::FromEntries(std::vector<Note>{Note{"Other", "x"}}); }));
    assert(Throws<std::invalid_argument>([] {
        NoteLog::FromEntries(std::vector<Note>{
            Note{NoteLog::kWorkInstructions, "a"}, Note{"n", "1"}, Note{"n", "2"}});
    }));
    std::cout << "[PASS] NoteLog" << std::endl;
}

static void TestJobEditing() {
    std::cout << "[Test] Job editing..." << std::endl;
    assert(Throws<std::invalid_argument>([] { Job bad("12345"); }));

    Job job("105000");
    Project& p = job.addProject("105000.1", "Bore to size", "Brandon", "1/1/2020");
    assert(p.aliasNum() == "105000.1");
    assert(p.dueDate() == "01/01/2020");
    assert(Throws<std::invalid_argument>([&] { job.addProject("105000.1", "x", "y", "01/01/2020"); }));
    assert(Throws<std::invalid_argument>([&] { job.addProject("105000.2", "x", "y", "tomorrow"); }));
    assert(!job.hasProject("105000.2"));

    job.project("105000.1").addNote("Started", "Brandon");
    job.renameProject("105000.1", "105000-177-43-01");
    assert(!job.hasProject("105000.1"));
    const Project& renamed = job.project("105000-177-43-01");
    assert(renamed.aliasNum() == "105000.1");
    assert(renamed.notes().size() == 2);

    job.renameProject("105000-177-43-01", "105000-177-43-01");
    assert(job.projects().size() == 1);
    assert(Throws<ProjectNotFoundError>([&] { job.renameProject("105000.9", "105000.8"); }));

    std::string copy = job.duplicateProject("105000-177-43-01");
    assert(copy == "105000-177-43-01 (2)");
    assert(job.duplicateProject("105000-177-43-01") == "105000-177-43-01 (3)");
    const Project& dup = job.project(copy);
    assert(dup.notes().size() == 1);
    assert(dup.aliasNum() == "105000.1");
    assert(dup.owner() == "Brandon");

    assert(Throws<std::invalid_argument>([&] { job.renameProject(copy, "105000-177-43-01"); }));

    job.addProject("105000.5", "Later", "Ana", "03/15/2021");
    assert(job.latestDueDate()->toString() == "03/15/2021");
    assert(job.drawingNumbers().size() == 1);

    job.removeProject("105000.5");
    assert(Throws<ProjectNotFoundError>([&] { job.removeProject("105000.5"); }));
    assert(!Job("105001").latestDueDate());
    std::cout << "[PASS] Job editing" << std::endl;
}

static void TestGlance() {
    std::cout << "[Test] Jobs at a glance..." << std::endl;
    ProjectIndex index;
    index.emplace("105000.1", Project("105000.1", "a", "Brandon", "01/01/2020"));
    index.emplace("105000.2", Project("105000.2", "b", "Ana", "01/05/2020"));
    index.emplace("105000.3", Project("105000.3", "c", "Ana", "01/07/2020"));
    index.emplace("105000.4", Project("105000.4", "d", "Ana", "01/08/2020"));
    index.emplace("105000.5", Project("105000.5", "e", "Ana", "01/01/2020", ProjectStatus::Completed));
    index.emplace("200000.1", Project("200000.1", "f", "Brandon", "12/31/2020", ProjectStatus::Completed));

    auto groups = GroupByJob(index);
    assert(groups.size() == 2);
    assert(groups["105000"].size() == 5);

    auto glance = JobsAtAGlance(groups, CalendarDate(2020, 1, 5));
    GlanceCounts expected;
    expected.expired = 1;
    expected.today = 1;
    expected.approaching = 1;
    assert(glance["105000"] == expected);
    assert(glance.count("200000") == 1);
    assert(glance["200000"] == GlanceCounts());

    auto mine = FilterByOwner(index, "Brandon");
    assert(mine.size() == 2);
    std::cout << "[PASS] Jobs at a glance" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Domain Model Test..." << std::endl;
    TestCalendarDate();
    TestStatusAndKeys();
    TestNoteLog();
    TestJobEditing();
    TestGlance();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
