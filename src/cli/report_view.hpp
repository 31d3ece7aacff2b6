#pragma once

#include <string>
#include <iostream>
#include <vector>
#include <effects/report.hpp>
#include <service/worktree_service.hpp>

// Git outcome, per-effect table, summary and remediation of add/remove.
void print_report(const OperationReport& report, std::ostream& out = std::cout);

enum class ListFormat { Table, Simple, Yaml, Json };

bool parse_list_format(const std::string& name, ListFormat& out);

// Machine-readable listing. Json is emitted as flow YAML with every string
// double-quoted, which any JSON parser accepts.
std::string worktrees_document(const std::vector<WorktreeInfo>& worktrees, ListFormat format);

void print_worktrees(const std::vector<WorktreeInfo>& worktrees, ListFormat format);

void print_status(const WorktreeStatus& status);
