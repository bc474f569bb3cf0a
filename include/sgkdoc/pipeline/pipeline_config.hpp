/**
 * @file pipeline_config.hpp
 * @brief Upload limits, collaborator timeouts and storage location
 */

#ifndef SGKDOC_PIPELINE_PIPELINE_CONFIG_HPP
#define SGKDOC_PIPELINE_PIPELINE_CONFIG_HPP

#include "sgkdoc/storage/sqlite_database.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sgkdoc::pipeline {

struct pipeline_config {
    /// Largest accepted upload
    std::size_t max_upload_bytes = 15 * 1024 * 1024;

    /// Declared media types accepted at upload
    std::vector<std::string> allowed_media_types = {
        "image/jpeg", "image/jpg", "image/png", "image/tiff", "application/pdf"};

    /// Limit for one OCR call; exceeding it fails the run
    std::chrono::milliseconds ocr_timeout{30000};

    /// Run the OCR call on the thread_system pool (otherwise a dedicated thread)
    bool use_worker_pool = true;

    /// Runs process_batch() executes at once; 0 means the worker pool size
    std::size_t max_parallel_runs = 0;

    /// Finished runs whose state remains queryable through state_of()
    std::size_t finished_run_history = 256;

    /// Move linked patients to documents_uploaded after a commit
    bool update_workflow = true;
};

struct storage_config {
    std::string database_path = "sgkdoc.db";
    storage::database_config database;
};

}  // namespace sgkdoc::pipeline

#endif  // SGKDOC_PIPELINE_PIPELINE_CONFIG_HPP
