/**
 * @file patient.hpp
 * @brief Patient identity fields read by the pipeline
 *
 * Patients are owned by the host application. The pipeline reads them for
 * matching and refers to them only by id.
 */

#pragma once

#include <string>

namespace sgkdoc {

/**
 * @brief Identity fields of one patient
 */
struct patient {
    std::string id;
    std::string name;        ///< Full name, e.g. "Ali Veli"
    std::string tc_number;   ///< 11-digit national identity number, may be empty
    std::string birth_date;  ///< YYYY-MM-DD (DD.MM.YYYY accepted), may be empty
    std::string phone;       ///< Any formatting, may be empty
};

}  // namespace sgkdoc
