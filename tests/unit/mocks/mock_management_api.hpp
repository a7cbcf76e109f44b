#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "proxy/management_api.hpp"

namespace proxyvisor::tests {

class MockManagementApi : public proxy::IManagementApi {
public:
    MOCK_METHOD(bool, check_responding, (), (override));
    MOCK_METHOD(common::Status, list_auth_files, (std::vector<proxy::AuthFile> &), (override));
    MOCK_METHOD(common::Status, list_auth_file_models, (const std::string &, std::vector<std::string> &),
                (override));
    MOCK_METHOD(common::Status, api_call, (const proxy::ApiCallRequest &, proxy::ApiCallResponse &), (override));
};

}  // namespace proxyvisor::tests
