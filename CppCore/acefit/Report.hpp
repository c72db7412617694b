#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Plain text tables of error reports and dataset assessments.
 */

#include <string>

#include "acefit/DatasetAssessment.hpp"
#include "acefit/ErrorAggregator.hpp"

namespace acefit {

/**
 * @brief Which statistic an error table shows.
 */
enum class ErrorMetric { MAE, RMSE };

/**
 * @brief Renders one statistic of a report.
 * @param report The error report.
 * @param metric The statistic.
 * @return A table with one row per group and a rule before @c "set".
 *
 * Energy, virial and per-atom energy columns are shown in meV, forces in
 * eV/A.
 */
std::string format_error_table(const ErrorReport &report, ErrorMetric metric);

/**
 * @brief Renders an assessment with @c total and @c missing rows.
 * @param assessment The dataset assessment.
 * @return The table.
 */
std::string format_assessment(const DatasetAssessment &assessment);

/**
 * @brief Logs the RMSE table followed by the MAE table at info level.
 * @param report The error report.
 * @return Void.
 */
void print_errors_tables(const ErrorReport &report);

} // namespace acefit
