#include "orchestrator.hpp"
#include "fake_transport.hpp"
#include <atomic>
#include <cassert>
#include <iostream>

static RunRequest make_request(const std::string& source, const std::string& token = "2024"){
    RunRequest request;
    request.sourceSpec = source;
    request.credentials.host = "files.example.com";
    request.credentials.username = "deploy";
    request.credentials.secret = ScopedSecret("hunter2");
    request.remoteBaseDir = "/data/";
    request.subdirToken = token;
    return request;
}

struct EventLog {
    std::vector<ProgressEvent> events;
    ProgressSink sink(){ return [this](const ProgressEvent& e){ events.push_back(e); }; }
    bool has(RunPhase phase, Severity severity) const {
        for (const auto& e : events) if (e.phase==phase && e.severity==severity) return true;
        return false;
    }
};

static void test_directory_end_to_end(){
    auto d = make_temp_dir("orch_dir");
    write_file(d/"proj"/"a.txt", "a");
    write_file(d/"proj"/"b.txt", "b");
    FakeRemote remote;
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"proj").string()), log.sink());

    assert(outcome.status==TransferStatus::Verified);
    assert(outcome.destination=="/data/2024/");
    assert(remote.count("ensure:/data/2024/")==1);
    assert(remote.count("upload:proj:/data/2024/")==1);
    assert(remote.count("list:/data/2024/")==1);
    assert(remote.calls[0]=="open:files.example.com");
    assert(remote.calls[1]=="ensure:/data/2024/");
    assert(remote.calls[2]=="upload:proj:/data/2024/");
    assert(remote.calls[3]=="list:/data/2024/");
    assert(outcome.items.size()==1 && outcome.items[0].succeeded);
    assert(outcome.verification.verified());
    assert(listingContains(outcome.verification.lines, "proj"));
    assert(!outcome.abortError);
    assert(remote.sessionsCreated==1);
}

static void test_empty_wildcard(){
    auto d = make_temp_dir("orch_empty");
    write_file(d/"notes.txt", "x");
    FakeRemote remote;
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"*.log").string()), log.sink());

    assert(outcome.status==TransferStatus::EmptyResolution);
    assert(remote.count("upload:")==0);
    assert(remote.count("list:")==0);
    assert(!outcome.abortError);
    assert(outcome.items.empty());
    assert(log.has(RunPhase::Done, Severity::Warning));
}

static void test_partial_failure_continues(){
    auto d = make_temp_dir("orch_partial");
    write_file(d/"f1.dat", "1");
    write_file(d/"f2.dat", "2");
    write_file(d/"f3.dat", "3");
    FakeRemote remote;
    remote.failUploads.insert("f2.dat");
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"*.dat").string()), log.sink());

    assert(outcome.status==TransferStatus::PartialFailure);
    assert(outcome.items.size()==3);
    assert(remote.count("upload:")==3);
    assert(remote.count("list:")==1);
    for (const auto& r : outcome.items){
        if (r.item.basename=="f2.dat"){
            assert(!r.succeeded);
            assert(r.error && r.error->kind==TransferErrorKind::ItemTransferFailure);
            assert(r.error->message.find("connection reset")!=std::string::npos);
        } else {
            assert(r.succeeded && !r.error);
        }
    }
    assert(outcome.succeededCount()==2 && outcome.failedCount()==1);
    assert(log.has(RunPhase::Uploading, Severity::Error));
}

static void test_invalid_input_no_io(){
    auto d = make_temp_dir("orch_invalid");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    TransferOrchestrator orchestrator(fakeFactory(remote));

    auto noSecret = make_request((d/"a.txt").string());
    noSecret.credentials.secret.clear();
    auto outcome = orchestrator.run(std::move(noSecret), {});
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::InvalidInput);

    auto noSource = make_request("");
    outcome = orchestrator.run(std::move(noSource), {});
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::InvalidInput);

    assert(remote.calls.empty());
    assert(remote.sessionsCreated==0);
}

static void test_traversal_token_rejected(){
    auto d = make_temp_dir("orch_traversal");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    TransferOrchestrator strict(fakeFactory(remote));
    auto outcome = strict.run(make_request((d/"a.txt").string(), "../../etc"), {});
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::InvalidInput);
    assert(remote.calls.empty());

    OrchestratorOptions permissive;
    permissive.rejectTraversal = false;
    TransferOrchestrator lenient(fakeFactory(remote), permissive);
    outcome = lenient.run(make_request((d/"a.txt").string(), "/../x/"), {});
    assert(outcome.destination=="/data/../x/");
    assert(outcome.status==TransferStatus::Verified);
}

static void test_mkdir_failure_is_fatal(){
    auto d = make_temp_dir("orch_mkdir");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    remote.failMkdir = true;
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"a.txt").string()), log.sink());
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::RemoteCommandFailure);
    assert(outcome.abortError->exitCode==1);
    assert(outcome.abortError->stderrText.find("Permission denied")!=std::string::npos);
    assert(remote.count("upload:")==0);
    assert(remote.count("list:")==0);
    assert(log.has(RunPhase::Aborted, Severity::Error));
}

static void test_source_not_found_after_mkdir(){
    auto d = make_temp_dir("orch_notfound");
    FakeRemote remote;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"missing.bin").string()), {});
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::SourceNotFound);
    assert(remote.count("ensure:")==1);
    assert(remote.count("upload:")==0);
}

static void test_open_failures_are_distinct(){
    auto d = make_temp_dir("orch_open");
    write_file(d/"a.txt", "a");
    for (auto kind : {TransferErrorKind::AuthenticationFailure, TransferErrorKind::ConnectionFailure,
                      TransferErrorKind::TransportFailure}){
        FakeRemote remote;
        remote.failOpen = true;
        remote.openFailure = kind;
        TransferOrchestrator orchestrator(fakeFactory(remote));
        auto outcome = orchestrator.run(make_request((d/"a.txt").string()), {});
        assert(outcome.status==TransferStatus::Aborted);
        assert(outcome.abortError->kind==kind);
        assert(remote.count("ensure:")==0);
    }
    assert(errorKindHint(TransferErrorKind::AuthenticationFailure).find("username")!=std::string_view::npos);
    assert(errorKindHint(TransferErrorKind::ConnectionFailure).find("network")!=std::string_view::npos);
}

static void test_listing_failure_downgrades(){
    auto d = make_temp_dir("orch_unverified");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    remote.failList = true;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"a.txt").string()), {});
    assert(outcome.status==TransferStatus::CompletedUnverified);
    assert(outcome.items[0].succeeded);
    assert(outcome.verification.attempted && !outcome.verification.listed);
    assert(outcome.verification.error->kind==TransferErrorKind::RemoteCommandFailure);
    assert(!outcome.abortError);
}

static void test_listing_missing_entry(){
    auto d = make_temp_dir("orch_missing_entry");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    remote.hideFromListing.insert("a.txt");
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"a.txt").string()), log.sink());
    assert(outcome.status==TransferStatus::CompletedUnverified);
    assert(outcome.verification.listed);
    assert(outcome.verification.missing.size()==1 && outcome.verification.missing[0]=="a.txt");
    assert(log.has(RunPhase::Verifying, Severity::Warning));
}

static void test_event_order(){
    auto d = make_temp_dir("orch_events");
    write_file(d/"x1.bin", "1");
    write_file(d/"x2.bin", "2");
    FakeRemote remote;
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"x?.bin").string()), log.sink());
    assert(outcome.status==TransferStatus::Verified);
    std::vector<RunPhase> phases;
    for (const auto& e : log.events) phases.push_back(e.phase);
    std::vector<RunPhase> expected{RunPhase::Validating, RunPhase::EnsuringDirectory, RunPhase::EnsuringDirectory,
                                   RunPhase::Resolving, RunPhase::Uploading, RunPhase::Uploading,
                                   RunPhase::Verifying, RunPhase::Done};
    assert(phases==expected);
    for (std::size_t i = 1; i < log.events.size(); ++i)
        assert(log.events[i-1].timestamp <= log.events[i].timestamp);
}

static void test_cancellation_between_items(){
    auto d = make_temp_dir("orch_cancel");
    write_file(d/"c1.bin", "1");
    write_file(d/"c2.bin", "2");
    write_file(d/"c3.bin", "3");
    FakeRemote remote;
    std::atomic<bool> cancel{false};
    auto request = make_request((d/"c?.bin").string());
    request.cancelFlag = &cancel;
    // Cancel as soon as the first upload is reported.
    ProgressSink sink = [&](const ProgressEvent& e){ if (e.phase==RunPhase::Uploading) cancel = true; };
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(std::move(request), sink);
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::Cancelled);
    assert(remote.count("upload:")==1);
    assert(remote.count("list:")==0);
    std::size_t cancelledItems = 0;
    for (const auto& r : outcome.items)
        if (r.error && r.error->kind==TransferErrorKind::Cancelled) ++cancelledItems;
    assert(cancelledItems==2);

    FakeRemote idle;
    std::atomic<bool> early{true};
    auto before = make_request((d/"c1.bin").string());
    before.cancelFlag = &early;
    TransferOrchestrator second(fakeFactory(idle));
    outcome = second.run(std::move(before), {});
    assert(outcome.abortError->kind==TransferErrorKind::Cancelled);
    assert(idle.calls.empty());
}

static void test_exception_becomes_unexpected_failure(){
    auto d = make_temp_dir("orch_throw");
    write_file(d/"a.txt", "a");
    FakeRemote remote;
    remote.throwOnUpload = true;
    TransferOrchestrator orchestrator(fakeFactory(remote));
    auto outcome = orchestrator.run(make_request((d/"a.txt").string()), {});
    assert(outcome.status==TransferStatus::Aborted);
    assert(outcome.abortError->kind==TransferErrorKind::UnexpectedFailure);
    assert(outcome.abortError->message.find("disk on fire")!=std::string::npos);
}

static void test_parallel_uploads(){
    auto d = make_temp_dir("orch_parallel");
    for (int i = 0; i < 12; ++i) write_file(d/("p" + std::to_string(i) + ".bin"), "data");
    FakeRemote remote;
    remote.failUploads.insert("p5.bin");
    remote.failUploads.insert("p9.bin");
    OrchestratorOptions options;
    options.parallelUploads = 4;
    std::size_t uploadEvents = 0;
    ProgressSink sink = [&](const ProgressEvent& e){ if (e.phase==RunPhase::Uploading) ++uploadEvents; };
    TransferOrchestrator orchestrator(fakeFactory(remote), options);
    auto outcome = orchestrator.run(make_request((d/"p*.bin").string()), sink);

    assert(outcome.status==TransferStatus::PartialFailure);
    assert(outcome.items.size()==12);
    assert(remote.count("upload:")==12);
    assert(outcome.failedCount()==2);
    assert(uploadEvents==12);
    assert(remote.sessionsCreated==4);
    assert(remote.count("list:")==1);

    // items keep plan order regardless of which worker finished first
    PathResolver resolver;
    auto plan = resolver.resolve((d/"p*.bin").string());
    for (std::size_t i = 0; i < plan->size(); ++i)
        assert(outcome.items[i].item.basename==(*plan)[i].basename);
}

static void test_parallel_worker_session_failure(){
    auto d = make_temp_dir("orch_parallel_degraded");
    for (int i = 0; i < 5; ++i) write_file(d/("q" + std::to_string(i) + ".bin"), "data");
    FakeRemote remote;
    remote.failSessionsAfter = 1; // only the run's own session can be created
    OrchestratorOptions options;
    options.parallelUploads = 3;
    EventLog log;
    TransferOrchestrator orchestrator(fakeFactory(remote), options);
    auto outcome = orchestrator.run(make_request((d/"q*.bin").string()), log.sink());
    assert(outcome.status==TransferStatus::Verified);
    assert(remote.count("upload:")==5);
    assert(log.has(RunPhase::Uploading, Severity::Warning));
}

static void test_outcome_exit_codes(){
    TransferOutcome outcome;
    outcome.status = TransferStatus::Verified;
    assert(exitCodeFor(outcome, false)==0);
    outcome.status = TransferStatus::CompletedUnverified;
    assert(exitCodeFor(outcome, false)==0);
    outcome.status = TransferStatus::EmptyResolution;
    assert(exitCodeFor(outcome, false)==0);
    outcome.status = TransferStatus::PartialFailure;
    assert(exitCodeFor(outcome, false)==2);
    assert(exitCodeFor(outcome, true)==0);
    outcome.status = TransferStatus::Aborted;
    assert(exitCodeFor(outcome, true)==1);
}

static void test_listing_contains(){
    std::vector<std::string> lines{
        "total 12",
        "drwxr-xr-x 2 deploy deploy 4.0K Mar  1 09:00 proj",
        "-rw-r--r-- 1 deploy deploy  12K Mar  1 09:00 my report.pdf",
        "lrwxrwxrwx 1 deploy deploy    4 Mar  1 09:00 latest -> proj",
    };
    assert(listingContains(lines, "proj"));
    assert(listingContains(lines, "my report.pdf"));
    assert(listingContains(lines, "latest"));
    assert(!listingContains(lines, "report.pdf.bak"));
    assert(!listingContains(lines, "roj"));
    assert(!listingContains(lines, "total"));

    // another file ending in the same text, or a symlink target, is not the entry itself
    std::vector<std::string> lookalikes{
        "-rw-r--r-- 1 deploy deploy  12K Mar  1 09:00 my report.pdf",
        "lrwxrwxrwx 1 deploy deploy    5 Mar  1 09:00 link -> a.txt",
        "crw-rw-rw- 1 root   root   1, 3 Mar  1 09:00 null",
    };
    assert(!listingContains(lookalikes, "report.pdf"));
    assert(!listingContains(lookalikes, "a.txt"));
    assert(listingContains(lookalikes, "link"));
    assert(listingContains(lookalikes, "null"));
    assert(listingEntryName("-rw-r--r-- 1 deploy deploy 1.2K Jan  2  2023 old.log")=="old.log");
    assert(listingEntryName("total 8").empty());
}

static void test_unreadable_directory_fails_only_that_item(){
    auto d = make_temp_dir("orch_vanish");
    write_file(d/"d1"/"a.txt", "1");
    write_file(d/"d2"/"b.txt", "2");
    write_file(d/"d3"/"c.txt", "3");
    for (bool parallel : {false, true}){
        FakeRemote remote;
        remote.vanishBeforeUpload.insert("d2");
        OrchestratorOptions options;
        options.parallelUploads = parallel ? 2 : 1;
        TransferOrchestrator orchestrator(fakeFactory(remote), options);
        auto outcome = orchestrator.run(make_request((d/"d?").string()), {});

        assert(outcome.status==TransferStatus::PartialFailure);
        assert(!outcome.abortError);
        assert(remote.count("upload:")==3);
        assert(remote.count("list:")==1);
        for (const auto& r : outcome.items){
            if (r.item.basename=="d2"){
                assert(!r.succeeded);
                assert(r.error && r.error->kind==TransferErrorKind::ItemTransferFailure);
                assert(r.error->message.find("Failed to read local directory")!=std::string::npos);
            } else {
                assert(r.succeeded);
            }
        }
        write_file(d/"d2"/"b.txt", "2");
    }
}

int main(){
    test_directory_end_to_end();
    test_empty_wildcard();
    test_partial_failure_continues();
    test_invalid_input_no_io();
    test_traversal_token_rejected();
    test_mkdir_failure_is_fatal();
    test_source_not_found_after_mkdir();
    test_open_failures_are_distinct();
    test_listing_failure_downgrades();
    test_listing_missing_entry();
    test_event_order();
    test_cancellation_between_items();
    test_exception_becomes_unexpected_failure();
    test_parallel_uploads();
    test_parallel_worker_session_failure();
    test_outcome_exit_codes();
    test_listing_contains();
    test_unreadable_directory_fails_only_that_item();
    std::cout << "All orchestrator tests passed" << std::endl;
    return 0;
}
