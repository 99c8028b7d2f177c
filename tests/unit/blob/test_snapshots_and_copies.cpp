/**
 * @file test_snapshots_and_copies.cpp
 * @brief Unit tests for snapshots, server-side copies, HTTP properties and file transfers
 */

#include "blob_test_fixture.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

class SnapshotAndCopyTest : public BlobServiceFixture {
protected:
    static auto temp_path(const std::string& name) -> std::filesystem::path {
        return std::filesystem::temp_directory_path() / ("blob_transfer_" + name);
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
        std::ifstream file(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        if (!raw.empty()) {
            std::memcpy(bytes.data(), raw.data(), raw.size());
        }
        return bytes;
    }

    static void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }
};

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(SnapshotAndCopyTest, SnapshotKeepsContentAfterOverwrite) {
    auto client = blob("versioned.txt");
    ASSERT_TRUE(client.upload_text("first").has_value());
    ASSERT_TRUE(client.set_metadata({{"stage", "draft"}}).has_value());

    auto snapshot = client.create_snapshot();
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;
    EXPECT_FALSE(snapshot->empty());
    EXPECT_EQ(service_->snapshot_count(container_, "versioned.txt"), 1u);

    ASSERT_TRUE(client.upload_text("second").has_value());
    {
        auto text = client.download_text();
        EXPECT_EQ(text.has_value() ? text.value() : std::string(""), "second");
    }

    auto frozen = client.with_snapshot(*snapshot);
    EXPECT_TRUE(frozen.is_snapshot());
    EXPECT_EQ(frozen.snapshot(), *snapshot);
    EXPECT_NE(frozen.url().find("?snapshot="), std::string::npos);
    {
        auto text = frozen.download_text();
        EXPECT_EQ(text.has_value() ? text.value() : std::string(""), "first");
    }

    auto props = frozen.get_properties();
    ASSERT_TRUE(props.has_value()) << props.error().message;
    EXPECT_EQ(props->content_length, 5u);
    EXPECT_EQ(props->metadata.at("stage"), "draft");
}

TEST_F(SnapshotAndCopyTest, SnapshotMetadataOverridesBlobMetadata) {
    service_->seed_blob(container_, "tagged.txt", to_bytes("x"));
    auto client = blob("tagged.txt");
    ASSERT_TRUE(client.set_metadata({{"owner", "ops"}}).has_value());

    auto snapshot = client.create_snapshot({{"reason", "backup"}});
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;

    auto props = client.with_snapshot(*snapshot).get_properties();
    ASSERT_TRUE(props.has_value()) << props.error().message;
    EXPECT_EQ(props->metadata, (std::map<std::string, std::string>{{"reason", "backup"}}));
    EXPECT_EQ(service_->blob_metadata(container_, "tagged.txt").at("owner"), "ops");

    auto invalid = client.create_snapshot({{"reason", ""}});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, error_code::invalid_metadata);
}

TEST_F(SnapshotAndCopyTest, SnapshotIsReadOnly) {
    service_->seed_blob(container_, "frozen.txt", to_bytes("keep"));
    auto client = blob("frozen.txt");
    auto snapshot = client.create_snapshot();
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;

    auto frozen = client.with_snapshot(*snapshot);
    auto written = frozen.set_metadata({{"owner", "ops"}}, {}, no_retry_options({}));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().status_code(), 400);
}

TEST_F(SnapshotAndCopyTest, DeleteRespectsSnapshots) {
    service_->seed_blob(container_, "snapped.txt", to_bytes("data"));
    auto client = blob("snapped.txt");
    auto first = client.create_snapshot();
    auto second = client.create_snapshot();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    auto refused = client.delete_blob();
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::conflict);
    EXPECT_TRUE(service_->blob_exists(container_, "snapped.txt"));

    ASSERT_TRUE(client.with_snapshot(*first).delete_blob().has_value());
    EXPECT_EQ(service_->snapshot_count(container_, "snapped.txt"), 1u);

    ASSERT_TRUE(client.delete_blob(delete_snapshots_option::delete_snapshots_only).has_value());
    EXPECT_EQ(service_->snapshot_count(container_, "snapped.txt"), 0u);
    EXPECT_TRUE(service_->blob_exists(container_, "snapped.txt"));

    ASSERT_TRUE(client.create_snapshot().has_value());
    ASSERT_TRUE(client.delete_blob(delete_snapshots_option::include_snapshots).has_value());
    EXPECT_FALSE(service_->blob_exists(container_, "snapped.txt"));
    EXPECT_EQ(service_->snapshot_count(container_, "snapped.txt"), 0u);
}

TEST_F(SnapshotAndCopyTest, MissingSnapshotIsNotFound) {
    service_->seed_blob(container_, "plain.txt", to_bytes("x"));
    auto props = blob("plain.txt").with_snapshot("2020-01-01T00:00:00.9999999Z").get_properties();
    ASSERT_FALSE(props.has_value());
    EXPECT_EQ(props.error().code, error_code::blob_not_found);
}

// ============================================================================
// Copies
// ============================================================================

TEST_F(SnapshotAndCopyTest, CopyCompletesWithContentAndMetadata) {
    auto payload = make_payload(3000);
    auto md5 = checksum::md5_base64(payload);
    ASSERT_TRUE(md5.has_value());
    service_->seed_blob(container_, "source.bin", payload, md5.value());
    auto source = blob("source.bin");
    ASSERT_TRUE(source.set_metadata({{"origin", "camera"}}).has_value());

    auto target = blob("target.bin");
    auto state = target.start_copy(source);
    ASSERT_TRUE(state.has_value()) << state.error().message;
    EXPECT_FALSE(state->copy_id.empty());
    EXPECT_EQ(state->status, copy_status::success);
    EXPECT_EQ(state->source, source.url());

    EXPECT_EQ(service_->blob_content(container_, "target.bin"), payload);
    auto props = target.get_properties();
    ASSERT_TRUE(props.has_value()) << props.error().message;
    EXPECT_EQ(props->content_md5, md5.value());
    EXPECT_EQ(props->metadata.at("origin"), "camera");
    ASSERT_TRUE(props->copy.has_value());
    EXPECT_EQ(props->copy->copy_id, state->copy_id);
    EXPECT_EQ(props->copy->status, copy_status::success);
    EXPECT_EQ(props->copy->bytes_copied, 3000u);
    EXPECT_EQ(props->copy->total_bytes, 3000u);

    auto requests = service_->requests();
    auto copy_request = std::find_if(requests.begin(), requests.end(),
                                     [](const recorded_request& r) {
                                         return r.headers.count("x-ms-copy-source") > 0;
                                     });
    ASSERT_NE(copy_request, requests.end());
    EXPECT_EQ(copy_request->body_size, 0u);
}

TEST_F(SnapshotAndCopyTest, CopyWithMetadataOverride) {
    service_->seed_blob(container_, "source.txt", to_bytes("text"));
    ASSERT_TRUE(blob("source.txt").set_metadata({{"origin", "camera"}}).has_value());

    auto state = blob("renamed.txt").start_copy(blob("source.txt"), {}, {}, {{"origin", "copy"}});
    ASSERT_TRUE(state.has_value()) << state.error().message;
    EXPECT_EQ(service_->blob_metadata(container_, "renamed.txt"),
              (std::map<std::string, std::string>{{"origin", "copy"}}));
    EXPECT_EQ(service_->blob_metadata(container_, "source.txt").at("origin"), "camera");
}

TEST_F(SnapshotAndCopyTest, CopyFromSnapshot) {
    auto source = blob("history.txt");
    ASSERT_TRUE(source.upload_text("old").has_value());
    auto snapshot = source.create_snapshot();
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;
    ASSERT_TRUE(source.upload_text("new").has_value());

    auto state = blob("restored.txt").start_copy(source.with_snapshot(*snapshot));
    ASSERT_TRUE(state.has_value()) << state.error().message;
    {
        auto text = blob("restored.txt").download_text();
        EXPECT_EQ(text.has_value() ? text.value() : std::string(""), "old");
    }
}

TEST_F(SnapshotAndCopyTest, CopyChecksSourceAndDestinationConditions) {
    service_->seed_blob(container_, "source.txt", to_bytes("abc"));
    service_->seed_blob(container_, "existing.txt", to_bytes("keep"));
    const auto source_etag = service_->blob_etag(container_, "source.txt");
    auto options = no_retry_options({});

    auto stale_source = blob("copy.txt").start_copy(
        blob("source.txt"), access_condition::if_match_etag("\"0xstale\""), {}, {}, options);
    ASSERT_FALSE(stale_source.has_value());
    EXPECT_EQ(stale_source.error().code, error_code::precondition_failed);
    EXPECT_FALSE(service_->blob_exists(container_, "copy.txt"));

    auto matching = blob("copy.txt").start_copy(
        blob("source.txt"), access_condition::if_match_etag(source_etag), {}, {}, options);
    ASSERT_TRUE(matching.has_value()) << matching.error().message;

    auto taken = blob("existing.txt").start_copy(
        blob("source.txt"), {}, access_condition::if_not_exists(), {}, options);
    ASSERT_FALSE(taken.has_value());
    EXPECT_EQ(taken.error().code, error_code::conflict);
    EXPECT_EQ(service_->blob_content(container_, "existing.txt"), to_bytes("keep"));
}

TEST_F(SnapshotAndCopyTest, CopyOfMissingSourceFails) {
    auto state = blob("copy.txt").start_copy(blob("nowhere.txt"), {}, {}, {},
                                             no_retry_options({}));
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, error_code::blob_not_found);
}

TEST_F(SnapshotAndCopyTest, PendingCopyCanBeFollowedAndAborted) {
    service_->seed_blob(container_, "big.bin", make_payload(2048));
    service_->hold_copies_pending(true);

    auto first = blob("first.bin").start_copy(blob("big.bin"));
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first->status, copy_status::pending);

    auto pending = blob("first.bin").get_properties();
    ASSERT_TRUE(pending.has_value()) << pending.error().message;
    ASSERT_TRUE(pending->copy.has_value());
    EXPECT_EQ(pending->copy->status, copy_status::pending);
    EXPECT_EQ(pending->copy->bytes_copied, 0u);
    EXPECT_EQ(pending->copy->total_bytes, 2048u);

    auto options = no_retry_options({});
    auto mismatch = blob("first.bin").abort_copy("not-the-copy", {}, options);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, error_code::conflict);

    ASSERT_TRUE(blob("first.bin").abort_copy(first->copy_id, {}, options).has_value());
    auto aborted = blob("first.bin").get_properties();
    ASSERT_TRUE(aborted.has_value());
    EXPECT_EQ(aborted->copy->status, copy_status::aborted);
    EXPECT_EQ(aborted->content_length, 0u);

    auto again = blob("first.bin").abort_copy(first->copy_id, {}, options);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::conflict);

    auto second = blob("second.bin").start_copy(blob("big.bin"));
    ASSERT_TRUE(second.has_value()) << second.error().message;
    service_->complete_pending_copies();
    auto done = blob("second.bin").get_properties();
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->copy->status, copy_status::success);
    EXPECT_EQ(service_->blob_content(container_, "second.bin"), make_payload(2048));
}

TEST_F(SnapshotAndCopyTest, AbortCopyRequiresCopyId) {
    auto result = blob("x").abort_copy("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_argument);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(SnapshotAndCopyTest, ParseCopyStateReadsProgress) {
    http_response response;
    EXPECT_FALSE(parse_copy_state(response).has_value());

    response.headers["x-ms-copy-id"] = "abc";
    response.headers["x-ms-copy-status"] = "failed";
    response.headers["x-ms-copy-progress"] = "10/40";
    response.headers["x-ms-copy-status-description"] = "500 InternalError";
    auto state = parse_copy_state(response);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, copy_status::failed);
    EXPECT_EQ(state->bytes_copied, 10u);
    EXPECT_EQ(state->total_bytes, 40u);
    EXPECT_EQ(state->status_description, "500 InternalError");
}

// ============================================================================
// HTTP properties
// ============================================================================

TEST_F(SnapshotAndCopyTest, SetPropertiesReplacesHttpHeaders) {
    service_->seed_blob(container_, "page.html", to_bytes("<p>hi</p>"));
    auto client = blob("page.html");
    const auto before = service_->blob_etag(container_, "page.html");

    blob_http_headers headers;
    headers.content_type = "text/html";
    headers.cache_control = "max-age=60";
    headers.content_language = "en";
    headers.content_md5 = checksum::md5_base64(to_bytes("<p>hi</p>")).value();
    auto etag = client.set_properties(headers);
    ASSERT_TRUE(etag.has_value()) << etag.error().message;
    EXPECT_NE(*etag, before);

    auto props = client.get_properties();
    ASSERT_TRUE(props.has_value()) << props.error().message;
    EXPECT_EQ(props->content_type, "text/html");
    EXPECT_EQ(props->cache_control, "max-age=60");
    EXPECT_EQ(props->content_language, "en");
    EXPECT_EQ(props->content_md5, headers.content_md5);
    EXPECT_FALSE(props->content_encoding.has_value());

    // Unset fields are cleared
    blob_http_headers type_only;
    type_only.content_type = "text/plain";
    ASSERT_TRUE(client.set_properties(type_only).has_value());
    props = client.get_properties();
    ASSERT_TRUE(props.has_value());
    EXPECT_EQ(props->content_type, "text/plain");
    EXPECT_FALSE(props->cache_control.has_value());
    EXPECT_FALSE(props->content_md5.has_value());
}

TEST_F(SnapshotAndCopyTest, SetPropertiesWithStaleEtagFails) {
    service_->seed_blob(container_, "page.html", to_bytes("x"));
    blob_http_headers headers;
    headers.content_type = "text/html";

    auto result = blob("page.html").set_properties(
        headers, access_condition::if_match_etag("\"0xstale\""), no_retry_options({}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::precondition_failed);
}

TEST_F(SnapshotAndCopyTest, WrongStoredMd5FailsDownloadUntilCorrected) {
    auto payload = make_payload(600);
    service_->seed_blob(container_, "md5.bin", payload);
    auto client = blob("md5.bin");

    blob_http_headers headers;
    headers.content_md5 = checksum::md5_base64(make_payload(600, 1)).value();
    ASSERT_TRUE(client.set_properties(headers).has_value());
    auto wrong = client.download_to_bytes({}, no_retry_options({}));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, error_code::checksum_mismatch);

    headers.content_md5 = checksum::md5_base64(payload).value();
    ASSERT_TRUE(client.set_properties(headers).has_value());
    auto right = client.download_to_bytes();
    ASSERT_TRUE(right.has_value()) << right.error().message;
    EXPECT_EQ(right.value(), payload);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SnapshotAndCopyTest, UploadFromFileAndDownloadToFile) {
    auto payload = make_payload(5 * 1024 + 11);
    const auto source_path = temp_path("upload_source.bin");
    const auto target_path = temp_path("download_target.bin");
    write_file(source_path, payload);

    auto uploaded = blob("from-file.bin").upload_from_file(source_path, {},
                                                           small_block_options(1024, 2));
    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;
    EXPECT_EQ(uploaded->bytes_uploaded, payload.size());
    EXPECT_EQ(uploaded->manifest.size(), 6u);
    EXPECT_EQ(service_->blob_content(container_, "from-file.bin"), payload);

    auto downloaded = blob("from-file.bin").download_to_file(target_path, {},
                                                             small_block_options(1024, 2));
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(downloaded->bytes_downloaded, payload.size());
    EXPECT_EQ(read_file(target_path), payload);

    std::filesystem::remove(source_path);
    std::filesystem::remove(target_path);
}

TEST_F(SnapshotAndCopyTest, UploadFromMissingFileFails) {
    auto result = blob("x").upload_from_file(temp_path("does_not_exist.bin"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(SnapshotAndCopyTest, FailedDownloadRemovesFile) {
    const auto path = temp_path("failed_download.bin");
    auto result = blob("missing.bin").download_to_file(path, {}, no_retry_options({}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::blob_not_found);
    EXPECT_FALSE(std::filesystem::exists(path));
}

}  // namespace kcenon::blob_transfer::test
