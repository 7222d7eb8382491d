#include <gtest/gtest.h>

#include "sandbox/code_examples.hpp"

using coderun::sandbox::BuiltinExamples;

TEST(CodeExamples, CoverDefaultLanguages) {
    const auto& examples = BuiltinExamples();
    EXPECT_EQ(examples.size(), 3u);
    EXPECT_EQ(examples.count("python"), 1u);
    EXPECT_EQ(examples.count("javascript"), 1u);
    EXPECT_EQ(examples.count("bash"), 1u);
}

TEST(CodeExamples, BashExampleKeepsCommandSubstitution) {
    const auto& bash = BuiltinExamples().at("bash");
    EXPECT_EQ(bash.rfind("#!/bin/bash", 0), 0u);
    EXPECT_NE(bash.find("echo \"Current date: $(date)\"\n"), std::string::npos);
    EXPECT_EQ(bash.back(), '\n');
}

TEST(CodeExamples, SnippetsAreComplete) {
    for (const auto& [language, code] : BuiltinExamples()) {
        EXPECT_GT(code.size(), 50u) << language;
        EXPECT_EQ(code.back(), '\n') << language;
    }
}
