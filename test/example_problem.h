#ifndef EXAMPLE_PROBLEM_H_
#define EXAMPLE_PROBLEM_H_

#include <thread>
#include <memory>
#include <vector>
#include <filesystem>

#include <httplib.h>
#include <gtest/gtest.h>
#include <oigrade/checker.h>

#include "oigrade/grading_service.h"

// Lays out one problem on both sides of the boundary:
//   grading_dir/{inputs,outputs}/{pid}/{tid}.txt  (service only)
//   problems_dir/{pid}/input/{tid}.txt            (runner)
class ExampleProblem : public ::testing::Test {
 protected:
  void SetUp(const std::string& problem_id_,
             const std::vector<std::pair<std::string, std::string>>& tds);
  void TearDown() override;

  // Serves grading_dir on an ephemeral localhost port
  void StartServer();
  std::string ServerUrl() const;

  std::string problem_id;
  std::filesystem::path grading_dir, problems_dir;
  CheckerRegistry registry;
  std::unique_ptr<GradingService> service;

 private:
  httplib::Server svr_;
  std::thread server_thread_;
  int port_ = -1;
};

#endif  // EXAMPLE_PROBLEM_H_
