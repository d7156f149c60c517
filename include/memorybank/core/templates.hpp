#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/metadata/frontmatter.hpp"
#include "memorybank/storage/file_types.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace memorybank::core::templates {

using TemplateProvider = std::function<std::string(storage::FileType)>;

inline constexpr std::string_view PROJECT_BRIEF = R"(# Project Brief

- **Project:** (name)
- **Goal:** (what the project sets out to achieve)
)";

inline constexpr std::string_view PRODUCT_CONTEXT = R"(# Product Context

> _Describe the target users and the problem space here._
)";

inline constexpr std::string_view ACTIVE_CONTEXT = R"(# Active Context

> _Describe the current development focus here._
)";

inline constexpr std::string_view PROGRESS_CURRENT = R"(# Current Progress

| Item | Status | Notes |
|------|--------|-------|
)";

inline constexpr std::string_view PROGRESS_HISTORY = R"(# Progress History

Completed milestones, newest first.
)";

inline constexpr std::string_view PROGRESS_INDEX = R"(# Progress Index

Links to every progress report.
)";

inline constexpr std::string_view SYSTEM_PATTERNS_INDEX = R"(# System Patterns Index

See the individual pattern documents for details.
)";

inline constexpr std::string_view SYSTEM_PATTERNS_ARCHITECTURE = R"(# Architecture Overview

> _High-level architecture description goes here._
)";

inline constexpr std::string_view SYSTEM_PATTERNS_PATTERNS = R"(# Design Patterns

| Pattern | Purpose | Reference |
|---------|---------|-----------|
)";

inline constexpr std::string_view SYSTEM_PATTERNS_SCANNING = R"(# Scanning and I/O Strategy

Describe how files are discovered, loaded and refreshed.
)";

inline constexpr std::string_view TECH_CONTEXT_INDEX = R"(# Technology Context Index

Links to the stack, dependency and environment notes.
)";

inline constexpr std::string_view TECH_CONTEXT_STACK = R"(# Technology Stack

Languages, frameworks and services in use.
)";

inline constexpr std::string_view TECH_CONTEXT_DEPENDENCIES = R"(# Dependencies

Key runtime and development dependencies.
)";

inline constexpr std::string_view TECH_CONTEXT_ENVIRONMENT = R"(# Development Environment

Local and CI environment details.
)";

[[nodiscard]] std::string default_template(storage::FileType type);
[[nodiscard]] TemplateProvider default_provider();

// Generated header: id, title, description, type, tags, created, updated.
[[nodiscard]] common::Result<metadata::FrontMatter> generated_header(storage::FileType type,
                                                                     const std::string &timestamp);

// Provider text plus a generated header. Fields the provider already set in its
// own header are kept.
[[nodiscard]] common::Result<std::string> render_initial_content(storage::FileType type,
                                                                 const TemplateProvider &provider);

} // namespace memorybank::core::templates
