/**
 * @file test_batch_execution.cpp
 * @brief End-to-end batch tests against the in-memory service
 */

#include <gtest/gtest.h>

#include "blob_test_fixture.h"

#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

class BatchExecutionTest : public BlobServiceFixture {
protected:
    auto name_of(std::size_t i) const -> std::string { return "blob-" + std::to_string(i); }

    /**
     * @brief Delete batch over blobs that exist where @p exists is true
     */
    auto delete_batch(const std::vector<bool>& exists) -> blob_delete_batch {
        blob_delete_batch batch;
        for (std::size_t i = 0; i < exists.size(); ++i) {
            if (exists[i]) {
                service_->seed_blob(container_, name_of(i), make_payload(16, static_cast<uint32_t>(i)));
            }
            auto added = batch.add_delete(container_, name_of(i));
            EXPECT_TRUE(added.has_value());
            EXPECT_EQ(added.value(), i);
        }
        return batch;
    }

    void expect_interleaving(const std::vector<bool>& exists) {
        auto batch = delete_batch(exists);
        auto outcome = client_->execute_batch(batch);

        std::vector<std::size_t> expected_ok;
        std::vector<std::size_t> expected_failed;
        for (std::size_t i = 0; i < exists.size(); ++i) {
            (exists[i] ? expected_ok : expected_failed).push_back(i);
        }

        if (expected_failed.empty()) {
            ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
            ASSERT_EQ(outcome.value().size(), expected_ok.size());
            return;
        }

        ASSERT_FALSE(outcome.has_value());
        EXPECT_EQ(outcome.error().code, error_code::batch_operation_failed);
        EXPECT_NE(outcome.error().message.find(std::to_string(expected_failed.size()) + " of " +
                                               std::to_string(exists.size())),
                  std::string::npos)
            << outcome.error().message;

        const auto* failure = outcome.error().batch_failure();
        ASSERT_NE(failure, nullptr);
        ASSERT_EQ(failure->successes.size(), expected_ok.size());
        ASSERT_EQ(failure->errors.size(), expected_failed.size());

        for (std::size_t i = 0; i < expected_ok.size(); ++i) {
            EXPECT_EQ(failure->successes[i].operation_index, expected_ok[i]);
            EXPECT_EQ(failure->successes[i].status_code, 202);
        }
        for (std::size_t i = 0; i < expected_failed.size(); ++i) {
            EXPECT_EQ(failure->errors[i].operation_index, expected_failed[i]);
            EXPECT_EQ(failure->errors[i].status_code, 404);
            EXPECT_EQ(failure->errors[i].error_code, "BlobNotFound");
            EXPECT_FALSE(failure->errors[i].message.empty());
        }

        for (std::size_t i = 0; i < exists.size(); ++i) {
            EXPECT_FALSE(service_->blob_exists(container_, name_of(i)));
        }
    }
};

// ============================================================================
// Delete batches
// ============================================================================

TEST_F(BatchExecutionTest, AllDeletesSucceedInOneRequest) {
    auto batch = delete_batch({true, true, true, true, true});
    auto outcome = client_->execute_batch(batch);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    ASSERT_EQ(outcome.value().size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(outcome.value()[i].operation_index, i);
        EXPECT_FALSE(service_->blob_exists(container_, name_of(i)));
    }
    EXPECT_EQ(service_->total_requests(), 1u);
    EXPECT_EQ(service_->count_requests(http_method::post, "batch"), 1u);
}

TEST_F(BatchExecutionTest, SecondOperationFails) {
    expect_interleaving({true, false});
}

TEST_F(BatchExecutionTest, FirstOperationFails) {
    expect_interleaving({false, true});
}

TEST_F(BatchExecutionTest, AllOperationsFail) {
    expect_interleaving({false, false, false});
}

TEST_F(BatchExecutionTest, AlternatingOutcomes) {
    expect_interleaving({true, false, true, false, true});
}

TEST_F(BatchExecutionTest, FailuresAtBothEnds) {
    expect_interleaving({false, true, true, false});
}

TEST_F(BatchExecutionTest, SubRequestsCarryTheirOwnHeaders) {
    auto batch = delete_batch({true, true});
    ASSERT_TRUE(client_->execute_batch(batch).has_value());

    std::size_t subs = 0;
    for (const auto& request : service_->requests()) {
        if (!request.in_batch) {
            continue;
        }
        ++subs;
        EXPECT_EQ(request.method, http_method::del);
        EXPECT_EQ(request.headers.count("x-ms-date"), 1u);
        ASSERT_EQ(request.headers.count("Authorization"), 1u);
        EXPECT_EQ(request.headers.at("Authorization").rfind("SharedKey devaccount:", 0), 0u);
    }
    EXPECT_EQ(subs, 2u);
}

// ============================================================================
// Set tier batches
// ============================================================================

TEST_F(BatchExecutionTest, SetTierBatch) {
    service_->seed_blob(container_, "a", make_payload(8));
    service_->seed_blob(container_, "b", make_payload(8));

    blob_set_tier_batch batch;
    ASSERT_TRUE(batch.add_set_tier(container_, "a", standard_blob_tier::cool).has_value());
    ASSERT_TRUE(batch.add_set_tier(container_, "b", standard_blob_tier::cool).has_value());

    auto outcome = client_->execute_batch(batch);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().size(), 2u);
    EXPECT_EQ(service_->blob_tier(container_, "a"), "Cool");
    EXPECT_EQ(service_->blob_tier(container_, "b"), "Cool");
}

// ============================================================================
// Credentials and validation
// ============================================================================

TEST_F(BatchExecutionTest, OperationCredentialsSignSubRequest) {
    service_->seed_blob(container_, "sas-blob", make_payload(8));

    blob_delete_batch batch;
    auto sas = storage_credentials::sas("devaccount", "?sv=2021-08-06&sp=d&sig=abc123");
    ASSERT_TRUE(batch.add_delete(container_, "sas-blob", delete_snapshots_option::none, {}, sas)
                    .has_value());

    ASSERT_TRUE(client_->execute_batch(batch).has_value());

    bool found = false;
    for (const auto& request : service_->requests()) {
        if (request.in_batch) {
            found = true;
            EXPECT_EQ(request.query.count("sig"), 1u);
            EXPECT_EQ(request.headers.count("Authorization"), 0u);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(BatchExecutionTest, EmptyBatchRejectedByService) {
    blob_delete_batch batch;
    auto outcome = client_->execute_batch(batch);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::service_error);
    EXPECT_EQ(outcome.error().status_code(), 400);
    EXPECT_EQ(outcome.error().batch_failure(), nullptr);
}

TEST_F(BatchExecutionTest, TooManyOperationsRejectedLocally) {
    blob_delete_batch batch;
    for (std::size_t i = 0; i < blob_batch::max_operations; ++i) {
        ASSERT_TRUE(batch.add_delete(container_, name_of(i)).has_value());
    }
    auto extra = batch.add_delete(container_, "one-too-many");
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code, error_code::batch_too_large);
    EXPECT_EQ(batch.size(), blob_batch::max_operations);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(BatchExecutionTest, EmptyNamesRejected) {
    blob_delete_batch batch;
    auto no_blob = batch.add_delete(container_, "");
    ASSERT_FALSE(no_blob.has_value());
    EXPECT_EQ(no_blob.error().code, error_code::invalid_argument);

    auto no_container = batch.add_delete("", "blob");
    ASSERT_FALSE(no_container.has_value());
    EXPECT_EQ(no_container.error().code, error_code::invalid_argument);
    EXPECT_TRUE(batch.empty());
}

TEST_F(BatchExecutionTest, OuterRequestRetriedWhenBusy) {
    auto batch = delete_batch({true, true});
    service_->inject_failure(
        [](const recorded_request& r) { return r.comp() == "batch"; }, 503, "ServerBusy");

    auto outcome = client_->execute_batch(batch);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().size(), 2u);
    EXPECT_EQ(service_->count_requests(http_method::post, "batch"), 2u);
    EXPECT_GE(client_->statistics().retries, 1u);
}

}  // namespace kcenon::blob_transfer::test
