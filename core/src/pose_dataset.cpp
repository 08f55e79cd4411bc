#include "batchkin/core/io/pose_dataset.hpp"

#include "batchkin/core/common/logger.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace batchkin::core {

static const char* const kPoseColumns[kPoseWidth] = {"x", "y", "z", "qw", "qx", "qy", "qz"};

static std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) cells.push_back(cell);
  if (!line.empty() && line.back() == ',') cells.emplace_back();
  return cells;
}

static bool parseDouble(const std::string& cell, double* out) {
  if (cell.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(cell.c_str(), &end);
  if (end == cell.c_str()) return false;
  while (*end == ' ' || *end == '\r') ++end;
  if (*end != '\0') return false;
  *out = v;
  return true;
}

Status writePoseDatasetCsv(const PoseDataset& dataset, const std::string& csv_path) {
  const char* op = "writePoseDatasetCsv";
  const BatchArray& q = dataset.joint_angles;
  const BatchArray& p = dataset.poses;

  if (q.rows() < 1) {
    return logFailure(Status::Precondition, op, "dataset is empty");
  }
  if (q.rows() != p.rows()) {
    return logFailure(Status::Precondition, op, "joint_angles and poses row counts differ");
  }
  if (p.cols() != kPoseWidth) {
    return logFailure(Status::ShapeMismatch, op, "poses must have 7 columns");
  }
  if (!q.allFinite() || !p.allFinite()) {
    return logFailure(Status::NonFinite, op, "NaN/Inf in dataset");
  }

  std::ofstream out(csv_path);
  if (!out) {
    return logFailure(Status::Failure, op, "failed to open output file: " + csv_path);
  }

  out << std::setprecision(17);
  for (Eigen::Index j = 0; j < q.cols(); ++j) out << "q" << j << ",";
  for (int k = 0; k < kPoseWidth; ++k) out << kPoseColumns[k] << (k + 1 < kPoseWidth ? "," : "\n");

  for (Eigen::Index i = 0; i < q.rows(); ++i) {
    for (Eigen::Index j = 0; j < q.cols(); ++j) out << q(i, j) << ",";
    for (int k = 0; k < kPoseWidth; ++k) out << p(i, k) << (k + 1 < kPoseWidth ? "," : "\n");
  }

  if (!out) {
    return logFailure(Status::Failure, op, "write failed: " + csv_path);
  }
  return Status::Success;
}

Status readPoseDatasetCsv(const std::string& csv_path, PoseDataset* dataset) {
  const char* op = "readPoseDatasetCsv";
  if (!dataset) return logFailure(Status::InvalidParameter, op, "null output");

  std::ifstream in(csv_path);
  if (!in) {
    return logFailure(Status::Failure, op, "failed to open: " + csv_path);
  }

  std::string line;
  if (!std::getline(in, line)) {
    return logFailure(Status::Failure, op, "missing header: " + csv_path);
  }
  if (!line.empty() && line.back() == '\r') line.pop_back();
  const std::vector<std::string> header = splitCsvLine(line);
  if (header.size() < static_cast<std::size_t>(kPoseWidth)) {
    return logFailure(Status::ShapeMismatch, op, "header has fewer than 7 columns");
  }
  const std::size_t ndof = header.size() - kPoseWidth;
  for (std::size_t j = 0; j < ndof; ++j) {
    if (header[j] != "q" + std::to_string(j)) {
      return logFailure(Status::Failure, op, "unexpected header cell: " + header[j]);
    }
  }
  for (int k = 0; k < kPoseWidth; ++k) {
    if (header[ndof + k] != kPoseColumns[k]) {
      return logFailure(Status::Failure, op,
                        "expected pose column " + std::string(kPoseColumns[k]) +
                        ", got: " + header[ndof + k]);
    }
  }

  std::vector<std::vector<double>> rows;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line == "\r") continue;
    const std::vector<std::string> cells = splitCsvLine(line);
    if (cells.size() != header.size()) {
      return logFailure(Status::ShapeMismatch, op,
                        "line " + std::to_string(line_no) + " has " +
                        std::to_string(cells.size()) + " cells");
    }
    std::vector<double> row(cells.size());
    for (std::size_t k = 0; k < cells.size(); ++k) {
      if (!parseDouble(cells[k], &row[k])) {
        return logFailure(Status::Failure, op,
                          "unparsable cell on line " + std::to_string(line_no));
      }
    }
    rows.push_back(std::move(row));
  }
  if (rows.empty()) {
    return logFailure(Status::Precondition, op, "no samples in: " + csv_path);
  }

  const auto n = static_cast<Eigen::Index>(rows.size());
  PoseDataset ds;
  ds.joint_angles.resize(n, static_cast<Eigen::Index>(ndof));
  ds.poses.resize(n, kPoseWidth);
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto& row = rows[static_cast<std::size_t>(i)];
    for (std::size_t j = 0; j < ndof; ++j) ds.joint_angles(i, static_cast<Eigen::Index>(j)) = row[j];
    for (int k = 0; k < kPoseWidth; ++k) ds.poses(i, k) = row[ndof + static_cast<std::size_t>(k)];
  }
  if (!ds.joint_angles.allFinite() || !ds.poses.allFinite()) {
    return logFailure(Status::NonFinite, op, "NaN/Inf in: " + csv_path);
  }

  if (shouldLog(LogLevel::Debug)) {
    log(LogLevel::Debug, std::string(op) + ": " + std::to_string(n) + " samples, ndof " +
                         std::to_string(ndof));
  }
  *dataset = std::move(ds);
  return Status::Success;
}

}  // namespace batchkin::core
