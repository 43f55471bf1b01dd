/*
 * YAML output tests - Launch-TOML
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <gtest/gtest.h>
#include <launch-toml/output/yaml.hpp>

using namespace launchtoml;

TEST(FormatYaml, EmptyMapPrintsNothing) {
    EXPECT_EQ(format_yaml(ProcessMap{}), "");
}

TEST(FormatYaml, SingleEntry) {
    ProcessMap m; m.set("web", "gunicorn app:app");
    EXPECT_EQ(format_yaml(m), "---\ndefault_process_types:\n  web: gunicorn app:app\n");
}

TEST(FormatYaml, MapOrderAndVerbatimValues) {
    ProcessMap m;
    m.set("web", "echo hi && exit 0");
    m.set("worker", "dotnet MyApp.dll '--flag value'");
    EXPECT_EQ(format_yaml(m),
              "---\ndefault_process_types:\n"
              "  web: echo hi && exit 0\n"
              "  worker: dotnet MyApp.dll '--flag value'\n");
}
