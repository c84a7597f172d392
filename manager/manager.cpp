#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/engine.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

// Requests larger than this are rejected.
const constexpr int64_t kMaxRequestSize = 64 * 1024 * 1024;

const constexpr char* kUsage =
    "judgebox <command> [flags]\n"
    "\n"
    "Commands:\n"
    "  submit  judge the SubmitRequest in --request\n"
    "  test    like submit, comparing outputs ignoring whitespace\n"
    "  run     run the RunRequest in --request once\n"
    "  check   report which languages can be run";

enum ExitCode { kSuccess = 0, kInternalError = 1, kClientError = 2 };

std::string ReadRequest() {
  if (FLAGS_request == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  bool truncated = false;
  std::string request =
      util::File::Read(FLAGS_request, kMaxRequestSize, &truncated);
  if (truncated) throw manager::invalid_request("The request is too large");
  return request;
}

template <typename T>
T ParseRequest() {
  T message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(ReadRequest(),
                                                            &message, options);
  if (!status.ok())
    throw manager::invalid_request("Malformed request: " + status.ToString());
  return message;
}

void PrintResponse(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, &options);
  if (!status.ok())
    throw std::runtime_error("Cannot serialize the response: " +
                             status.ToString());
  std::cout << json << std::endl;
}

void PrintError(const std::string& error, bool client_error) {
  proto::ErrorResponse response;
  response.set_error(error);
  response.set_client_error(client_error);
  PrintResponse(response);
}

void Judge(manager::Engine* engine, proto::CompareMode mode) {
  auto request = ParseRequest<proto::SubmitRequest>();
  proto::ExecuteOptions options = request.options();
  options.set_mode(mode);
  std::vector<proto::TestCase> test_cases(request.test_cases().begin(),
                                          request.test_cases().end());
  PrintResponse(engine->Execute(request.code(), request.language(),
                                test_cases, options));
}

void RunOnce(manager::Engine* engine) {
  auto request = ParseRequest<proto::RunRequest>();
  PrintResponse(
      engine->RunOnce(request.code(), request.language(), request.stdin()));
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (argc != 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "util/flags");
    return kClientError;
  }
  const std::string command = argv[1];

  try {
    manager::Engine engine(manager::EngineConfig::FromFlags());
    if (command == "submit") {
      Judge(&engine, proto::SUBMIT);
    } else if (command == "test") {
      Judge(&engine, proto::RUN);
    } else if (command == "run") {
      RunOnce(&engine);
    } else if (command == "check") {
      PrintResponse(engine.CheckEnvironment());
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      std::cerr << kUsage << std::endl;
      return kClientError;
    }
  } catch (const manager::client_error& e) {
    LOG(WARNING) << "Rejected " << command << " request: " << e.what();
    PrintError(e.what(), true);
    return kClientError;
  } catch (const std::exception& e) {
    LOG(ERROR) << "The " << command << " command failed: " << e.what();
    PrintError("Internal error", false);
    return kInternalError;
  }
  return kSuccess;
}
