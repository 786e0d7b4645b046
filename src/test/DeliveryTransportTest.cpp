#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "application/IngestService.hpp"
#include "domain/SegmentMetadata.hpp"
#include "infrastructure/HttpSegmentUploader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/StorageHttpServer.hpp"

using namespace audiovault;
using namespace audiovault::infrastructure;
namespace fs = std::filesystem;

namespace {

struct Fixture {
    domain::CompressedArtifact artifact;
    domain::SegmentMetadata metadata;
};

Fixture MakeArtifact(const fs::path& dir, const std::string& name) {
    Fixture f;
    f.artifact.path = (dir / name).string();
    {
        std::ofstream out(f.artifact.path, std::ios::binary);
        out << std::string(1024, 'x');
    }
    f.artifact.sizeBytes = 1024;
    f.artifact.format = domain::AudioFormat::Opus;
    f.artifact.durationSeconds = 1.0;

    domain::PendingSegment segment;
    segment.samples.resize(16000);
    segment.startedAt = std::chrono::system_clock::now();
    f.metadata = domain::SegmentMetadata::Describe(segment, f.artifact, 16000);
    return f;
}

UploaderSettings FastSettings(const std::string& url) {
    UploaderSettings s;
    s.serverUrl = url;
    s.maxRetries = 2;
    s.retryDelay = std::chrono::milliseconds(20);
    s.uploadTimeout = std::chrono::seconds(2);
    s.probeTimeout = std::chrono::seconds(1);
    return s;
}

int UnusedPort() {
    httplib::Server probe;
    int port = probe.bind_to_any_port("127.0.0.1");
    return port; // released when probe goes out of scope
}

void TestDeliveryToStorageServer(const fs::path& work) {
    auto catalog = std::make_shared<StorageCatalog>((work / "server").string());
    auto decoder = std::make_shared<FfmpegDecoder>("audiovault-missing-decoder", std::chrono::seconds(5));
    auto service = std::make_shared<application::IngestService>(catalog, decoder, 16000);
    StorageHttpServer server(service, 50 * 1024 * 1024);
    int port = server.bindToAnyPort("127.0.0.1");
    assert(port > 0);
    std::thread t([&] { server.listenAfterBind(); });
    server.waitUntilReady();

    HttpSegmentUploader uploader(FastSettings("http://127.0.0.1:" + std::to_string(port)));
    assert(uploader.probe());

    Fixture f = MakeArtifact(work, "audio_2026-10-18_10-00-00.opus");
    assert(uploader.deliver(f.artifact, f.metadata));
    assert(uploader.isReachable());
    assert(uploader.deliveredCount() == 1);
    assert(uploader.attemptCount() == 1);

    auto files = service->listFiles();
    assert(files.size() == 1);
    assert(files[0].filename == "audio_2026-10-18_10-00-00.opus");
    assert(files[0].sizeBytes == 1024);
    assert(files[0].metadata.has_value());
    assert((*files[0].metadata)["sample_rate"] == 16000);
    assert((*files[0].metadata)["source_ip"] == "127.0.0.1");

    server.stop();
    t.join();
    std::cout << "[PASS] Artifact and metadata delivered to the storage server." << std::endl;
}

void TestUnreachableServerExhaustsRetries(const fs::path& work) {
    HttpSegmentUploader uploader(FastSettings("http://127.0.0.1:" + std::to_string(UnusedPort())));
    assert(!uploader.probe());
    assert(!uploader.isReachable());

    Fixture f = MakeArtifact(work, "dead.opus");
    auto begin = std::chrono::steady_clock::now();
    assert(!uploader.deliver(f.artifact, f.metadata));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    assert(uploader.attemptCount() == 3);
    assert(uploader.deliveredCount() == 0);
    assert(!uploader.isReachable());
    // Two waits between three attempts.
    assert(elapsed >= std::chrono::milliseconds(40));
    std::cout << "[PASS] Unreachable server: 3 attempts, then failure." << std::endl;
}

void TestTransientStatusIsRetried(const fs::path& work) {
    httplib::Server stub;
    std::atomic<int> hits{0};
    stub.Post("/upload", [&](const httplib::Request& req, httplib::Response& res) {
        int n = ++hits;
        assert(req.has_file("file"));
        assert(req.has_file("metadata"));
        if (n == 1) {
            res.status = 503;
            res.set_content("{\"error\":\"busy\"}", "application/json");
        } else {
            res.status = 201;
            res.set_content("{\"status\":\"ok\"}", "application/json");
        }
    });
    int port = stub.bind_to_any_port("127.0.0.1");
    std::thread t([&] { stub.listen_after_bind(); });
    stub.wait_until_ready();

    HttpSegmentUploader uploader(FastSettings("http://127.0.0.1:" + std::to_string(port)));
    Fixture f = MakeArtifact(work, "flaky.opus");
    assert(uploader.deliver(f.artifact, f.metadata));
    assert(hits == 2);
    assert(uploader.attemptCount() == 2);
    assert(uploader.isReachable());

    stub.stop();
    t.join();
    std::cout << "[PASS] 503 followed by 201 succeeds on the second attempt." << std::endl;
}

void TestRejectedStatusStaysRetryable(const fs::path& work) {
    httplib::Server stub;
    std::atomic<int> hits{0};
    stub.Post("/upload", [&](const httplib::Request&, httplib::Response& res) {
        ++hits;
        res.status = 400;
        res.set_content("{\"error\":\"No file provided\"}", "application/json");
    });
    int port = stub.bind_to_any_port("127.0.0.1");
    std::thread t([&] { stub.listen_after_bind(); });
    stub.wait_until_ready();

    HttpSegmentUploader uploader(FastSettings("http://127.0.0.1:" + std::to_string(port)));
    Fixture f = MakeArtifact(work, "rejected.opus");
    assert(!uploader.deliver(f.artifact, f.metadata));
    assert(hits == 3);
    assert(uploader.deliveredCount() == 0);

    stub.stop();
    t.join();
    std::cout << "[PASS] 400 is retried up to the attempt limit." << std::endl;
}

void TestMissingArtifactAborts() {
    HttpSegmentUploader uploader(FastSettings("http://127.0.0.1:" + std::to_string(UnusedPort())));
    domain::CompressedArtifact artifact;
    artifact.path = "/nonexistent/audiovault/segment.opus";
    domain::SegmentMetadata metadata;
    assert(!uploader.deliver(artifact, metadata));
    assert(uploader.attemptCount() == 0);
    std::cout << "[PASS] Unreadable artifact fails without a network attempt." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Delivery Transport Test..." << std::endl;
    fs::path work = PathUtils::CreateScratchDir("transport_test_");

    TestDeliveryToStorageServer(work);
    TestUnreachableServerExhaustsRetries(work);
    TestTransientStatusIsRetried(work);
    TestRejectedStatusStaysRetryable(work);
    TestMissingArtifactAborts();

    fs::remove_all(work);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
