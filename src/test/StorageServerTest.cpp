#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <set>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "application/IngestService.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/StorageHttpServer.hpp"

using namespace audiovault;
using namespace audiovault::infrastructure;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<application::IngestService> MakeService(const fs::path& dir, const std::string& decoderBinary) {
    auto catalog = std::make_shared<StorageCatalog>(dir.string());
    auto decoder = std::make_shared<FfmpegDecoder>(decoderBinary, std::chrono::seconds(10));
    return std::make_shared<application::IngestService>(catalog, decoder, 16000);
}

application::UploadRequest Upload(const std::string& name, const std::string& content,
                                  std::optional<std::string> metadata) {
    application::UploadRequest req;
    req.hasFile = true;
    req.filename = name;
    req.content = content;
    req.metadataJson = std::move(metadata);
    req.sourceAddress = "10.0.0.7";
    return req;
}

void TestIngestRules(const fs::path& work) {
    fs::path dir = work / "ingest";
    auto service = MakeService(dir, "audiovault-missing-decoder");

    // Missing file part and empty filename are rejected.
    application::UploadRequest none;
    auto rejected = service->upload(none);
    assert(!rejected.accepted);
    assert(rejected.error == "No file provided");

    auto unnamed = service->upload(Upload("", "abc", std::nullopt));
    assert(!unnamed.accepted);
    assert(unnamed.error == "Empty filename");

    // Duplicate names never overwrite.
    auto first = service->upload(Upload("clip.opus", "AAAA", std::string(R"({"sample_rate": 8000})")));
    auto second = service->upload(Upload("clip.opus", "BBBBBB", std::nullopt));
    assert(first.accepted && second.accepted);
    assert(first.stored.filename == "clip.opus");
    assert(second.stored.filename == "clip_1.opus");
    assert(fs::file_size(dir / "clip.opus") == 4);
    assert(fs::file_size(dir / "clip_1.opus") == 6);

    // Enrichment on top of client metadata.
    assert(first.metadataSaved);
    const json& meta = *first.stored.metadata;
    assert(meta["sample_rate"] == 8000);
    assert(meta["stored_filename"] == "clip.opus");
    assert(meta["stored_size_bytes"] == 4);
    assert(meta["source_ip"] == "10.0.0.7");
    assert(meta.contains("received_at"));

    // Malformed metadata becomes an empty record plus enrichment.
    auto broken = service->upload(Upload("broken.wav", "xyz", std::string("{not json")));
    assert(broken.accepted);
    const json& brokenMeta = *broken.stored.metadata;
    assert(brokenMeta.size() == 4);
    assert(brokenMeta["stored_filename"] == "broken.wav");

    // Listing skips sidecars and sub-directories, sorted by name.
    fs::create_directories(dir / "stray_dir");
    auto files = service->listFiles();
    assert(files.size() == 3);
    assert(files[0].filename == "broken.wav");
    assert(files[1].filename == "clip.opus");
    assert(files[2].filename == "clip_1.opus");
    for (const auto& f : files) {
        assert(f.metadata.has_value());
        assert(!f.modified.empty());
    }

    // Lookup is name-only.
    assert(service->locate("clip.opus").has_value());
    assert(!service->locate("nope.opus").has_value());
    assert(!service->locate("../ingest/clip.opus").has_value());

    // Decoder missing: every decompression is a server error, checked before existence.
    auto unavailable = service->decompress("clip.opus");
    assert(unavailable.status == application::DecompressOutcome::Status::DecoderUnavailable);

    json health = service->health();
    assert(health["status"] == "ok");
    assert(health["codec_available"] == false);
    assert(health["file_count"] == 6);
    assert(health.contains("storage_dir"));
    assert(health.contains("timestamp"));
    std::cout << "[PASS] Ingest, catalog and health rules." << std::endl;
}

void TestConcurrentSameNameUploads(const fs::path& work) {
    fs::path dir = work / "concurrent";
    auto service = MakeService(dir, "audiovault-missing-decoder");

    const int kThreads = 8;
    const int kPerThread = 10;
    std::vector<std::vector<std::string>> names(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string payload = "payload-" + std::to_string(t) + "-" + std::to_string(i);
                // Half of them share the stem with a different extension.
                std::string name = (i % 2 == 0) ? "seg.opus" : "seg.wav";
                auto outcome = service->upload(Upload(name, payload, std::nullopt));
                assert(outcome.accepted);
                names[t].push_back(outcome.stored.filename);
            }
        });
    }
    for (auto& th : threads) th.join();
    const std::size_t kUploads = static_cast<std::size_t>(kThreads * kPerThread);

    std::set<std::string> distinctNames;
    std::set<std::string> distinctStems;
    for (const auto& perThread : names) {
        for (const auto& n : perThread) {
            distinctNames.insert(n);
            distinctStems.insert(fs::path(n).stem().string());
        }
    }
    assert(distinctNames.size() == kUploads);
    // Each artifact owns its own sidecar.
    assert(distinctStems.size() == kUploads);

    // Every payload survived; none was truncated by a later writer.
    std::set<std::string> stored;
    for (const auto& f : service->listFiles()) {
        std::ifstream in(dir / f.filename, std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        stored.insert(content);
        assert((*f.metadata)["stored_filename"] == f.filename);
    }
    assert(stored.size() == kUploads);
    std::cout << "[PASS] Concurrent same-name uploads all land under distinct names." << std::endl;
}

void TestJsonNamesRejected(const fs::path& work) {
    auto service = MakeService(work / "reserved", "audiovault-missing-decoder");
    auto outcome = service->upload(Upload("notes.json", "{\"a\": 1}", std::nullopt));
    assert(!outcome.accepted);
    assert(outcome.error.find(".json") != std::string::npos);

    auto upper = service->upload(Upload("NOTES.JSON", "x", std::nullopt));
    assert(!upper.accepted);

    assert(service->listFiles().empty());
    std::cout << "[PASS] .json uploads are refused so no artifact is its own sidecar." << std::endl;
}

void TestHttpRoutes(const fs::path& work) {
    auto service = MakeService(work / "http", "audiovault-missing-decoder");
    StorageHttpServer server(service, 1024);
    int port = server.bindToAnyPort("127.0.0.1");
    assert(port > 0);
    std::thread t([&] { server.listenAfterBind(); });
    server.waitUntilReady();

    httplib::Client cli("127.0.0.1", port);

    auto health = cli.Get("/health");
    assert(health && health->status == 200);
    assert(json::parse(health->body)["codec_available"] == false);

    httplib::MultipartFormDataItems items = {
        {"file", "payload-bytes", "seg.opus", "application/octet-stream"},
        {"metadata", R"({"duration_seconds": 1.5})", "", ""}
    };
    auto up = cli.Post("/upload", items);
    assert(up && up->status == 201);
    json upBody = json::parse(up->body);
    assert(upBody["status"] == "ok");
    assert(upBody["filename"] == "seg.opus");
    assert(upBody["size_bytes"] == 13);
    assert(upBody["metadata_saved"] == true);

    httplib::MultipartFormDataItems noFile = {
        {"metadata", "{}", "", ""}
    };
    auto bad = cli.Post("/upload", noFile);
    assert(bad && bad->status == 400);
    assert(json::parse(bad->body)["error"] == "No file provided");

    // Payload over the configured limit is refused by the transport.
    httplib::MultipartFormDataItems huge = {
        {"file", std::string(4096, 'z'), "huge.opus", "application/octet-stream"}
    };
    auto tooBig = cli.Post("/upload", huge);
    assert(!tooBig || tooBig->status == 413);

    httplib::MultipartFormDataItems jsonFile = {
        {"file", "{}", "meta.json", "application/json"}
    };
    auto reserved = cli.Post("/upload", jsonFile);
    assert(reserved && reserved->status == 400);

    auto list = cli.Get("/files");
    assert(list && list->status == 200);
    json listBody = json::parse(list->body);
    assert(listBody["count"] == 1);
    assert(listBody["files"][0]["filename"] == "seg.opus");
    assert(listBody["files"][0]["metadata"]["duration_seconds"] == 1.5);

    auto download = cli.Get("/files/seg.opus");
    assert(download && download->status == 200);
    assert(download->body == "payload-bytes");

    auto missing = cli.Get("/files/absent.opus");
    assert(missing && missing->status == 404);

    auto decompress = cli.Post("/decompress/seg.opus");
    assert(decompress && decompress->status == 500);
    assert(json::parse(decompress->body).contains("error"));

    server.stop();
    t.join();
    std::cout << "[PASS] HTTP routes." << std::endl;
}

void TestDecompressMissingFile(const fs::path& work) {
    if (!ProcessRunner::FindExecutable("ffmpeg")) {
        std::cout << "[SKIP] ffmpeg not on PATH, 404 decompress path not exercised." << std::endl;
        return;
    }
    auto service = MakeService(work / "decode", "ffmpeg");
    auto outcome = service->decompress("ghost.opus");
    assert(outcome.status == application::DecompressOutcome::Status::NotFound);
    std::cout << "[PASS] Decompressing an unknown file reports not found." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Storage Server Test..." << std::endl;
    fs::path work = PathUtils::CreateScratchDir("storage_test_");

    TestIngestRules(work);
    TestConcurrentSameNameUploads(work);
    TestJsonNamesRejected(work);
    TestHttpRoutes(work);
    TestDecompressMissingFile(work);

    fs::remove_all(work);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
