#include "secrets/TemplateEngine.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

using netprov::common::DeviceTarget;
using netprov::common::UnresolvedVariableError;
using netprov::secrets::TemplateEngine;

class TemplateEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _dt.sName = "leaf7";
    _dt.sHost = "10.0.0.7";
    _dt.sDriver = "eos";
    _dt.oSecretsGroup = "fabric";
  }

  TemplateEngine _te;
  DeviceTarget _dt;
};

TEST_F(TemplateEngineTest, ExpandsKnownFields) {
  EXPECT_EQ(_te.expand("NAPALM_{{ obj.name }}_PASSWORD", _dt), "NAPALM_leaf7_PASSWORD");
  EXPECT_EQ(_te.expand("{{obj.host}}:{{ obj.driver }}", _dt), "10.0.0.7:eos");
  EXPECT_EQ(_te.expand("/run/{{ obj.secrets_group }}/pw", _dt), "/run/fabric/pw");
}

TEST_F(TemplateEngineTest, PlainTextUnchanged) {
  EXPECT_EQ(_te.expand("DEVICE_PASSWORD", _dt), "DEVICE_PASSWORD");
  EXPECT_EQ(_te.expand("", _dt), "");
}

TEST_F(TemplateEngineTest, UnknownPlaceholderThrows) {
  EXPECT_THROW(_te.expand("{{ obj.serial }}", _dt), UnresolvedVariableError);
}

TEST_F(TemplateEngineTest, UnterminatedPlaceholderThrows) {
  try {
    _te.expand("prefix {{ obj.name", _dt);
    FAIL() << "expected UnresolvedVariableError";
  } catch (const UnresolvedVariableError& ex) {
    EXPECT_EQ(ex._sErrorCode, "unterminated_placeholder");
  }
}
