// SPDX-License-Identifier: MIT

#include "qrem/calibration.hpp"
#include "check.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

using namespace qrem;

int main(){
  set_log_level(LogLevel::Off);
  const std::string path = "qrem_test_calibration.bin";
  CalibrationModel model;
  model.calibrate_independent({{0, qubit_runs(0.02, 0.04)}, {7, qubit_runs(0.01, 0.09)}});
  std::vector<Counts> states = {
    Counts{{"00", 90}, {"01", 10}}, Counts{{"01", 95}, {"11", 5}},
    Counts{{"10", 88}, {"00", 12}}, Counts{{"11", 97}, {"10", 3}}};
  model.calibrate_correlated({3, 2}, states);
  EXPECT_TRUE(model.save(path));

  CalibrationModel loaded;
  loaded.calibrate_independent({{5, qubit_runs(0.1, 0.1)}});
  std::string err;
  EXPECT_TRUE(loaded.load(path, err));
  EXPECT_EQ(loaded.qubits(), model.qubits());
  EXPECT_TRUE(!loaded.is_calibrated(5));
  for (auto q : model.qubits()){
    auto a = model.matrix_for(q);
    auto b = loaded.matrix_for(q);
    EXPECT_TRUE(a->kind == b->kind);
    EXPECT_EQ(a->qubits, b->qubits);
    EXPECT_EQ(a->data, b->data);
  }
  auto op = loaded.get_operator_for_subset({2, 3, 7});
  EXPECT_EQ(op->factors().size(), 2u);

  // corrupt copies are rejected and leave the target untouched
  std::string bytes;
  {
    std::ifstream in(path, std::ios::binary);
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  auto write = [&](const std::string& data){
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
  };

  std::string bad = bytes; bad[0] = 'X';
  write(bad);
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("Not a calibration file") != std::string::npos);

  bad = bytes; bad[8] = 9;   // version
  write(bad);
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("version") != std::string::npos);

  // header written on a host with the opposite byte order
  bad = bytes; std::reverse(bad.begin() + 12, bad.begin() + 16);
  write(bad);
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("byte order") != std::string::npos);
  bad = bytes; bad[12] ^= 0x40;
  write(bad);
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("flags") != std::string::npos);

  write(bytes.substr(0, bytes.size() - 4));
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("Truncated") != std::string::npos);

  // a matrix whose columns no longer sum to one
  bad = bytes;
  double scaled = 0.0;
  std::memcpy(&scaled, &bad[bad.size() - sizeof(double)], sizeof(double));
  scaled *= 0.5;
  std::memcpy(&bad[bad.size() - sizeof(double)], &scaled, sizeof(double));
  write(bad);
  EXPECT_TRUE(!loaded.load(path, err));
  EXPECT_TRUE(err.find("column-stochastic") != std::string::npos);

  EXPECT_EQ(loaded.qubits(), model.qubits());
  std::remove(path.c_str());
  EXPECT_TRUE(!loaded.load(path, err));
  return TEST_RESULT();
}
