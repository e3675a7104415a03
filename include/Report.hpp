// include/Report.hpp
#pragma once
#include "Operations.hpp"
#include <ostream>

// Human-readable rendering of operation results (stdout in the CLI).
void print_diff(std::ostream& os, const DiffResult& d, bool compare_time);
void print_create(std::ostream& os, const CreateResult& r);
void print_check(std::ostream& os, const CheckResult& r, bool compare_time);
void print_update(std::ostream& os, const UpdateResult& r, bool compare_time);
void print_list(std::ostream& os, const ListResult& r);
void print_compare(std::ostream& os, const CompareResult& r, bool compare_time);
void print_circl_check(std::ostream& os, const CirclCheckResult& r);
void print_purge(std::ostream& os, const PurgeResult& r);
void print_warnings(std::ostream& os, const std::vector<Warning>& warnings);
