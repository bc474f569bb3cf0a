/**
 * @file patient_directory_test.cpp
 * @brief Unit tests for the patient directory, workflow statuses and identity queries
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/storage/patient_directory.hpp>
#include <sgkdoc/storage/workflow_status.hpp>

using namespace sgkdoc;
using namespace sgkdoc::storage;
using Catch::Matchers::WithinAbs;

namespace {

std::shared_ptr<sqlite_database> open_memory() {
    auto db = sqlite_database::open(":memory:");
    REQUIRE(db.is_ok());
    return db.value();
}

}  // namespace

TEST_CASE("Workflow status metadata", "[storage][workflow]") {
    CHECK(workflow_order(workflow_status::inquiry_started) == 1);
    CHECK(workflow_order(workflow_status::payment_received) == 6);

    CHECK(workflow_label(workflow_status::documents_uploaded) == "Belgeler Yüklendi");
    CHECK_FALSE(workflow_description(workflow_status::invoiced).empty());

    SECTION("next action is the following step") {
        auto next = next_actions(workflow_status::materials_delivered);
        REQUIRE(next.size() == 1);
        CHECK(next.front() == workflow_status::documents_uploaded);
        CHECK(next_actions(workflow_status::payment_received).empty());
    }

    SECTION("legacy mapping") {
        CHECK(legacy_status(workflow_status::inquiry_started) == "pending");
        CHECK(legacy_status(workflow_status::prescription_saved) == "approved");
        CHECK(legacy_status(workflow_status::invoiced) == "approved");
        CHECK(legacy_status(workflow_status::payment_received) == "paid");
    }

    SECTION("parsing accepts names and legacy values") {
        for (auto status : all_workflow_statuses) {
            CHECK(parse_workflow_status(to_string(status)) == status);
        }
        CHECK(parse_workflow_status("pending") == workflow_status::inquiry_started);
        CHECK(parse_workflow_status("approved") == workflow_status::prescription_saved);
        CHECK(parse_workflow_status("paid") == workflow_status::payment_received);
        CHECK_FALSE(parse_workflow_status("archived").has_value());
        CHECK_FALSE(parse_workflow_status("").has_value());
    }
}

TEST_CASE("Patients are upserted and listed by id", "[storage][patients]") {
    sqlite_patient_directory directory(open_memory());

    REQUIRE(directory.upsert({"p2", "Ayşe Yılmaz", "", "", ""}).is_ok());
    REQUIRE(directory.upsert({"p1", "Ali Veli", "12345678950", "1965-07-03", "0532"}).is_ok());
    REQUIRE(directory.upsert({"p1", "Ali Veli", "12345678950", "1965-07-03", "0533"}).is_ok());

    auto all = directory.all();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 2);
    CHECK(all.value()[0].id == "p1");
    CHECK(all.value()[0].phone == "0533");
    CHECK(all.value()[1].name == "Ayşe Yılmaz");

    auto record = directory.find("p1");
    REQUIRE(record.has_value());
    CHECK(record->info.tc_number == "12345678950");
    CHECK_FALSE(record->current_status.has_value());
    CHECK_FALSE(record->last_identity_query.has_value());

    CHECK_FALSE(directory.find("missing").has_value());

    auto invalid = directory.upsert({"", "Nameless", "", "", ""});
    REQUIRE(invalid.is_err());
    CHECK(invalid.error().code == error_codes::invalid_argument);
}

TEST_CASE("Workflow status history is append-only", "[storage][patients][workflow]") {
    sqlite_patient_directory directory(open_memory());
    REQUIRE(directory.upsert({"p1", "Ali Veli", "", "", ""}).is_ok());

    REQUIRE(directory.set_workflow_status("p1", workflow_status::inquiry_started, "").is_ok());
    REQUIRE(directory
                .set_workflow_status("p1", workflow_status::documents_uploaded,
                                     "Reçete yüklendi: ALI_VELI_Recete.pdf")
                .is_ok());

    auto record = directory.find("p1");
    REQUIRE(record.has_value());
    CHECK(record->current_status == workflow_status::documents_uploaded);
    CHECK(record->legacy_status == "approved");

    auto history = directory.status_history("p1");
    REQUIRE(history.is_ok());
    REQUIRE(history.value().size() == 2);
    CHECK(history.value()[0].status == workflow_status::inquiry_started);
    CHECK(history.value()[1].status == workflow_status::documents_uploaded);
    CHECK(history.value()[1].label == "Belgeler Yüklendi");
    CHECK(history.value()[1].notes == "Reçete yüklendi: ALI_VELI_Recete.pdf");

    auto unknown = directory.set_workflow_status("nobody", workflow_status::invoiced, "");
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == error_codes::patient_not_found);
}

TEST_CASE("Last identity query is replaced and cleared", "[storage][patients][identity]") {
    sqlite_patient_directory directory(open_memory());
    REQUIRE(directory.upsert({"p1", "Ali Veli", "", "", ""}).is_ok());

    identity_query first{"run_1", 0.55, matching::match_tier::high,
                         sqlite_database::from_epoch_ms(1000)};
    identity_query second{"run_2", 0.30, matching::match_tier::medium,
                          sqlite_database::from_epoch_ms(2000)};

    REQUIRE(directory.set_last_identity_query("p1", first).is_ok());
    REQUIRE(directory.set_last_identity_query("p1", second).is_ok());

    auto record = directory.find("p1");
    REQUIRE(record.has_value());
    REQUIRE(record->last_identity_query.has_value());
    CHECK(record->last_identity_query->run_id == "run_2");
    CHECK_THAT(record->last_identity_query->confidence, WithinAbs(0.30, 1e-9));
    CHECK(record->last_identity_query->tier == matching::match_tier::medium);
    CHECK(record->last_identity_query->queried_at == sqlite_database::from_epoch_ms(2000));

    REQUIRE(directory.clear_last_identity_query("p1").is_ok());
    CHECK_FALSE(directory.find("p1")->last_identity_query.has_value());

    auto unknown = directory.set_last_identity_query("nobody", first);
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == error_codes::patient_not_found);
}
