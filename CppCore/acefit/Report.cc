// MIT License
// Copyright 2023--present acefit developers

#include "acefit/Report.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

#include "acefit/Log.hpp"

namespace acefit {

namespace {

constexpr size_t kNumWidth = 10;

size_t label_width(const std::vector<std::string> &labels) {
  size_t width = std::string_view("missing").size();
  for (const auto &label : labels) {
    width = std::max(width, label.size());
  }
  return width;
}

void append_rule(fmt::memory_buffer &buf, size_t label_w, size_t ncols) {
  fmt::format_to(std::back_inserter(buf), "{:-<{}}", "", label_w + 1);
  for (size_t c = 0; c < ncols; ++c) {
    fmt::format_to(std::back_inserter(buf), "+{:-<{}}", "", kNumWidth + 2);
  }
  buf.push_back('\n');
}

void append_header(fmt::memory_buffer &buf, size_t label_w,
                   std::initializer_list<std::string_view> columns) {
  fmt::format_to(std::back_inserter(buf), "{:<{}} ", "Type", label_w);
  for (auto col : columns) {
    fmt::format_to(std::back_inserter(buf), "| {:>{}} ", col, kNumWidth);
  }
  buf.push_back('\n');
}

void append_errors(fmt::memory_buffer &buf, size_t label_w,
                   const std::string &label, const ObsTable<double> &values) {
  fmt::format_to(std::back_inserter(buf),
                 "{:<{}} | {:>{}.3f} | {:>{}.3f} | {:>{}.3f} | {:>{}.3f} \n",
                 label, label_w, 1000.0 * values.E, kNumWidth, values.F,
                 kNumWidth, 1000.0 * values.V, kNumWidth, 1000.0 * values.PAE,
                 kNumWidth);
}

void append_counts(fmt::memory_buffer &buf, size_t label_w,
                   const std::string &label, const AssessmentRow &row) {
  fmt::format_to(std::back_inserter(buf),
                 "{:<{}} | {:>{}} | {:>{}} | {:>{}} | {:>{}} | {:>{}} \n",
                 label, label_w, row.configs, kNumWidth, row.environments,
                 kNumWidth, row.energies, kNumWidth, row.forces, kNumWidth,
                 row.virials, kNumWidth);
}

} // namespace

std::string format_error_table(const ErrorReport &report, ErrorMetric metric) {
  const size_t w = label_width(report.labels());
  fmt::memory_buffer buf;
  append_header(buf, w, {"E [meV]", "F [eV/A]", "V [meV]", "PAE [meV]"});
  append_rule(buf, w, 4);
  for (const auto &[label, stats] : report.items()) {
    if (label == kSetLabel) {
      append_rule(buf, w, 4);
    }
    append_errors(buf, w, label,
                  metric == ErrorMetric::MAE ? stats.mae : stats.rmse);
  }
  return fmt::to_string(buf);
}

std::string format_assessment(const DatasetAssessment &assessment) {
  const size_t w = label_width(assessment.groups.labels());
  fmt::memory_buffer buf;
  append_header(buf, w, {"#Configs", "#Envs", "#E", "#F", "#V"});
  append_rule(buf, w, 5);
  for (const auto &[label, row] : assessment.groups.items()) {
    append_counts(buf, w, label, row);
  }
  append_rule(buf, w, 5);
  append_counts(buf, w, "total", assessment.total);
  append_counts(buf, w, "missing", assessment.missing);
  return fmt::to_string(buf);
}

void print_errors_tables(const ErrorReport &report) {
  log::info("RMSE\n{}", format_error_table(report, ErrorMetric::RMSE));
  log::info("MAE\n{}", format_error_table(report, ErrorMetric::MAE));
}

} // namespace acefit
