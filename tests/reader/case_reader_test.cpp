/**
 * @file case_reader_test.cpp
 * @brief Unit tests for CaseReader queries over a Sellar-shaped store
 */

#include "reader/case_reader.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "test_utils/sellar_store.h"

using namespace casereader::reader;
using casereader::cases::Category;
using casereader::codec::NdArray;
using casereader::test::StoreBuilder;
using casereader::utils::ErrorCode;

namespace test = casereader::test;

namespace {

std::vector<std::string> Names(const std::vector<VariableListing>& listings) {
  std::vector<std::string> names;
  for (const auto& listing : listings) {
    names.push_back(listing.name);
  }
  return names;
}

}  // namespace

/**
 * @brief Two driver iterations with two mda solver iterations each
 *
 * Counters per iteration i (base 7 * i): NonlinearBlockGS 1, 2; mda 3;
 * NLRunOnce 4; root 5; driver 6; derivatives 7. Problem case "final" is 15.
 */
class CaseReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    builder_ = std::make_unique<StoreBuilder>("reader_sellar", 3);
    test::WriteSellarCases(*builder_, {2, 2});
    reader_ = OpenReader({});
  }

  std::unique_ptr<CaseReader> OpenReader(const casereader::config::ReaderConfig& config) {
    auto reader = CaseReader::Open(builder_->Path(), config);
    EXPECT_TRUE(reader) << reader.error().message();
    return reader ? std::move(*reader) : nullptr;
  }

  std::vector<std::string> Cases(const std::string& source, bool recurse) {
    auto cases = reader_->ListCases(source, recurse);
    EXPECT_TRUE(cases) << cases.error().message();
    return cases ? *cases : std::vector<std::string>{};
  }

  std::unique_ptr<StoreBuilder> builder_;
  std::unique_ptr<CaseReader> reader_;
};

TEST_F(CaseReaderTest, OpenSnapshotsEveryCategory) {
  ASSERT_TRUE(reader_);
  EXPECT_EQ(reader_->FormatVersion(), 3);
  EXPECT_EQ(reader_->Path(), builder_->Path());
  EXPECT_EQ(reader_->Store(Category::kDriver).Size(), 2U);
  EXPECT_EQ(reader_->Store(Category::kDriverDerivative).Size(), 2U);
  EXPECT_EQ(reader_->Store(Category::kSystem).Size(), 4U);
  EXPECT_EQ(reader_->Store(Category::kSolver).Size(), 6U);
  EXPECT_EQ(reader_->Store(Category::kProblem).Size(), 1U);
}

TEST_F(CaseReaderTest, ListSources) {
  EXPECT_EQ(reader_->ListSources(),
            std::vector<std::string>({"driver", "problem", "root.mda", "root", "root.mda.nonlinear_solver",
                                      "root.nonlinear_solver"}));
}

TEST_F(CaseReaderTest, ListCasesBySourceName) {
  EXPECT_EQ(Cases("driver", false), std::vector<std::string>({test::DriverCoordinate(0), test::DriverCoordinate(1)}));
  EXPECT_EQ(Cases("problem", false), std::vector<std::string>({"final"}));
  EXPECT_EQ(Cases("root", false), std::vector<std::string>({test::RootCoordinate(0), test::RootCoordinate(1)}));
  EXPECT_EQ(Cases("root.mda", false), std::vector<std::string>({test::MdaCoordinate(0), test::MdaCoordinate(1)}));
  EXPECT_EQ(Cases("root.mda.nonlinear_solver", false),
            std::vector<std::string>({test::MdaSolverCoordinate(0, 0), test::MdaSolverCoordinate(0, 1),
                                      test::MdaSolverCoordinate(1, 0), test::MdaSolverCoordinate(1, 1)}));
  EXPECT_EQ(Cases("root.nonlinear_solver", false),
            std::vector<std::string>({test::RootSolverCoordinate(0), test::RootSolverCoordinate(1)}));
}

TEST_F(CaseReaderTest, ListCasesFromRoot) {
  EXPECT_EQ(Cases("", false), std::vector<std::string>({test::DriverCoordinate(0), test::DriverCoordinate(1)}));

  auto all = Cases("", true);
  ASSERT_EQ(all.size(), 12U);
  EXPECT_EQ(all.front(), test::MdaSolverCoordinate(0, 0));
  EXPECT_EQ(all.back(), test::DriverCoordinate(1));
}

TEST_F(CaseReaderTest, ListCasesUnderCoordinate) {
  EXPECT_EQ(Cases(test::DriverCoordinate(0), false),
            std::vector<std::string>({test::RootCoordinate(0), test::DriverCoordinate(0)}));

  EXPECT_EQ(Cases(test::DriverCoordinate(0), true),
            std::vector<std::string>({test::MdaSolverCoordinate(0, 0), test::MdaSolverCoordinate(0, 1),
                                      test::MdaCoordinate(0), test::RootSolverCoordinate(0), test::RootCoordinate(0),
                                      test::DriverCoordinate(0)}));

  EXPECT_EQ(Cases(test::MdaCoordinate(1), false),
            std::vector<std::string>(
                {test::MdaSolverCoordinate(1, 0), test::MdaSolverCoordinate(1, 1), test::MdaCoordinate(1)}));

  // A leaf lists only itself
  EXPECT_EQ(Cases(test::MdaSolverCoordinate(1, 1), true), std::vector<std::string>({test::MdaSolverCoordinate(1, 1)}));
}

TEST_F(CaseReaderTest, CountersIncreaseAlongListings) {
  for (const auto& source : reader_->ListSources()) {
    auto sequence = reader_->GetCases(source, true);
    ASSERT_TRUE(sequence) << sequence.error().message();
    auto cases = sequence->Collect();
    ASSERT_TRUE(cases) << cases.error().message();
    for (size_t i = 1; i < cases->size(); ++i) {
      EXPECT_LT((*cases)[i - 1]->Counter(), (*cases)[i]->Counter()) << source;
    }
  }
}

TEST_F(CaseReaderTest, UnknownSources) {
  for (const std::string source : {"root.nothing", "bogus", "rank0:SLSQP|9", "rank0:SLSQP|0|nope|0"}) {
    auto cases = reader_->ListCases(source, false);
    ASSERT_FALSE(cases) << source;
    EXPECT_EQ(cases.error().code(), ErrorCode::kSourceNotFound) << source;
    EXPECT_EQ(cases.error().context(), source);

    auto sequence = reader_->GetCases(source);
    ASSERT_FALSE(sequence);
    EXPECT_EQ(sequence.error().code(), ErrorCode::kSourceNotFound);
  }
}

TEST_F(CaseReaderTest, ListCasesNested) {
  auto tree = reader_->ListCasesNested("", true);
  ASSERT_TRUE(tree) << tree.error().message();
  ASSERT_EQ(tree->size(), 2U);

  const auto& driver = (*tree)[0];
  EXPECT_EQ(driver.value.coordinate, test::DriverCoordinate(0));
  ASSERT_EQ(driver.children.size(), 1U);
  const auto& root = driver.children[0];
  EXPECT_EQ(root.value.coordinate, test::RootCoordinate(0));
  EXPECT_EQ(root.value.category, Category::kSystem);
  ASSERT_EQ(root.children.size(), 1U);
  const auto& root_solver = root.children[0];
  EXPECT_EQ(root_solver.value.category, Category::kSolver);
  ASSERT_EQ(root_solver.children.size(), 1U);
  const auto& mda = root_solver.children[0];
  EXPECT_EQ(mda.value.coordinate, test::MdaCoordinate(0));
  ASSERT_EQ(mda.children.size(), 2U);
  EXPECT_EQ(mda.children[1].value.coordinate, test::MdaSolverCoordinate(0, 1));
  EXPECT_TRUE(mda.children[1].children.empty());

  auto flat_children = reader_->ListCasesNested("", false);
  ASSERT_TRUE(flat_children);
  ASSERT_EQ(flat_children->size(), 2U);
  EXPECT_TRUE((*flat_children)[0].children.empty());
}

TEST_F(CaseReaderTest, ListCasesNestedUnderCoordinate) {
  auto tree = reader_->ListCasesNested(test::DriverCoordinate(1), true);
  ASSERT_TRUE(tree) << tree.error().message();
  ASSERT_EQ(tree->size(), 1U);
  EXPECT_EQ((*tree)[0].value.coordinate, test::DriverCoordinate(1));
  ASSERT_EQ((*tree)[0].children.size(), 1U);
  EXPECT_EQ((*tree)[0].children[0].value.coordinate, test::RootCoordinate(1));

  EXPECT_EQ(reader_->ListCasesNested("rank0:SLSQP|7", true).error().code(), ErrorCode::kSourceNotFound);
}

TEST_F(CaseReaderTest, RecursiveDriverListingIncludesEveryDescendant) {
  auto all = Cases("driver", true);
  ASSERT_EQ(all.size(), 12U);
  EXPECT_EQ(all, Cases("", true));
  for (const auto* store : {&reader_->Store(Category::kSystem), &reader_->Store(Category::kSolver)}) {
    for (const auto& entry : store->Coordinates()) {
      EXPECT_NE(std::find(all.begin(), all.end(), entry.coordinate.Raw()), all.end()) << entry.coordinate.Raw();
    }
  }
  EXPECT_EQ(Cases("problem", true), std::vector<std::string>({"final"}));
}

TEST_F(CaseReaderTest, RecursiveLocationListingIncludesNestedLocations) {
  EXPECT_EQ(Cases("root.nonlinear_solver", true),
            std::vector<std::string>({test::MdaSolverCoordinate(0, 0), test::MdaSolverCoordinate(0, 1),
                                      test::MdaCoordinate(0), test::RootSolverCoordinate(0),
                                      test::MdaSolverCoordinate(1, 0), test::MdaSolverCoordinate(1, 1),
                                      test::MdaCoordinate(1), test::RootSolverCoordinate(1)}));

  auto root = Cases("root", true);
  ASSERT_EQ(root.size(), 10U);
  EXPECT_EQ(root.back(), test::RootCoordinate(1));

  // Leaves have nothing below them
  EXPECT_EQ(Cases("root.mda.nonlinear_solver", true), Cases("root.mda.nonlinear_solver", false));
}

TEST_F(CaseReaderTest, NestedListingOfNamedSources) {
  auto drivers = reader_->ListCasesNested("driver", true);
  ASSERT_TRUE(drivers) << drivers.error().message();
  ASSERT_EQ(drivers->size(), 2U);
  const auto& driver = (*drivers)[1];
  EXPECT_EQ(driver.value.coordinate, test::DriverCoordinate(1));
  ASSERT_EQ(driver.children.size(), 1U);
  EXPECT_EQ(driver.children[0].value.coordinate, test::RootCoordinate(1));
  ASSERT_EQ(driver.children[0].children.size(), 1U);
  EXPECT_EQ(driver.children[0].children[0].value.coordinate, test::RootSolverCoordinate(1));

  auto solvers = reader_->ListCasesNested("root.nonlinear_solver", true);
  ASSERT_TRUE(solvers);
  ASSERT_EQ(solvers->size(), 2U);
  ASSERT_EQ((*solvers)[0].children.size(), 1U);
  const auto& mda = (*solvers)[0].children[0];
  EXPECT_EQ(mda.value.coordinate, test::MdaCoordinate(0));
  ASSERT_EQ(mda.children.size(), 2U);
  EXPECT_EQ(mda.children[0].value.coordinate, test::MdaSolverCoordinate(0, 0));

  auto shallow = reader_->ListCasesNested("driver", false);
  ASSERT_TRUE(shallow);
  ASSERT_EQ(shallow->size(), 2U);
  EXPECT_TRUE((*shallow)[0].children.empty());

  auto problem = reader_->ListCasesNested("problem", true);
  ASSERT_TRUE(problem);
  ASSERT_EQ(problem->size(), 1U);
  EXPECT_TRUE((*problem)[0].children.empty());
}

TEST_F(CaseReaderTest, GetCaseFromEveryCategory) {
  auto driver = reader_->GetCase(test::DriverCoordinate(1));
  ASSERT_TRUE(driver) << driver.error().message();
  EXPECT_EQ((*driver)->GetCategory(), Category::kDriver);
  EXPECT_EQ((*driver)->Counter(), 13);
  EXPECT_EQ(*(*driver)->Get("z"), test::SellarZ(1));
  EXPECT_EQ(*(*driver)->Get("obj"), NdArray::Scalar(test::SellarObjective(1)));

  auto system = reader_->GetCase(test::MdaCoordinate(0));
  ASSERT_TRUE(system);
  EXPECT_EQ((*system)->GetCategory(), Category::kSystem);
  EXPECT_EQ((*system)->Source(), "root.mda");
  EXPECT_EQ(*(*system)->Residuals()->Get("y2"), NdArray::Scalar(test::SellarY2Residual(0)));

  auto solver = reader_->GetCase(test::RootSolverCoordinate(0));
  ASSERT_TRUE(solver);
  EXPECT_EQ((*solver)->Source(), "root.nonlinear_solver");

  auto problem = reader_->GetCase("final");
  ASSERT_TRUE(problem);
  EXPECT_EQ((*problem)->GetCategory(), Category::kProblem);
  EXPECT_EQ(*(*problem)->Get("obj_cmp.obj"), NdArray::Scalar(test::SellarObjective(1)));

  auto missing = reader_->GetCase("rank0:SLSQP|42");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kCaseNotFound);
  EXPECT_EQ(missing.error().context(), "rank0:SLSQP|42");
}

TEST_F(CaseReaderTest, CachingFollowsConfiguration) {
  auto first = reader_->GetCase(test::DriverCoordinate(0));
  auto second = reader_->GetCase(test::DriverCoordinate(0));
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_NE(first->get(), second->get());
  EXPECT_EQ(**first, **second);

  auto cached = reader_->GetCase(test::DriverCoordinate(0), true);
  auto cached_again = reader_->GetCase(test::DriverCoordinate(0), true);
  EXPECT_EQ(cached->get(), cached_again->get());

  casereader::config::ReaderConfig config;
  config.cache_cases = true;
  auto caching_reader = OpenReader(config);
  ASSERT_TRUE(caching_reader);
  auto a = caching_reader->GetCase(test::MdaCoordinate(1));
  auto b = caching_reader->GetCase(test::MdaCoordinate(1));
  ASSERT_TRUE(a);
  EXPECT_EQ(a->get(), b->get());
  EXPECT_EQ(caching_reader->Store(Category::kSystem).CacheSize(), 1U);
}

TEST_F(CaseReaderTest, DerivativeCases) {
  auto derivatives = reader_->GetDerivativeCase(test::DriverCoordinate(1));
  ASSERT_TRUE(derivatives) << derivatives.error().message();
  EXPECT_EQ((*derivatives)->GetCategory(), Category::kDriverDerivative);
  const auto& jacobian = (*derivatives)->GetJacobian();
  ASSERT_TRUE(jacobian);
  EXPECT_EQ(*jacobian->Get("obj", "x"), NdArray({1, 1}, {2.0}));
  EXPECT_EQ(*jacobian->Get("obj_cmp.obj", "pz.z"), NdArray({1, 2}, {9.6, 1.8}));

  EXPECT_EQ(reader_->GetDerivativeCase(test::RootCoordinate(0)).error().code(), ErrorCode::kCaseNotFound);
}

TEST_F(CaseReaderTest, GetCasesSequence) {
  auto sequence = reader_->GetCases("driver", false);
  ASSERT_TRUE(sequence) << sequence.error().message();
  EXPECT_EQ(sequence->Size(), 2U);

  std::vector<int64_t> counters;
  while (true) {
    auto more = sequence->Next();
    ASSERT_TRUE(more) << more.error().message();
    if (!*more) {
      break;
    }
    counters.push_back(sequence->Current()->Counter());
  }
  EXPECT_EQ(counters, std::vector<int64_t>({6, 13}));

  sequence->Restart();
  auto all = sequence->Collect();
  ASSERT_TRUE(all);
  EXPECT_EQ(all->size(), 2U);

  auto mixed = reader_->GetCases(test::DriverCoordinate(0), true);
  ASSERT_TRUE(mixed);
  auto mixed_cases = mixed->Collect();
  ASSERT_TRUE(mixed_cases);
  ASSERT_EQ(mixed_cases->size(), 6U);
  EXPECT_EQ((*mixed_cases)[0]->GetCategory(), Category::kSolver);
  EXPECT_EQ((*mixed_cases)[2]->GetCategory(), Category::kSystem);
  EXPECT_EQ((*mixed_cases)[5]->GetCategory(), Category::kDriver);
}

TEST_F(CaseReaderTest, GetCasesDefaults) {
  auto problem = reader_->GetCases();
  ASSERT_TRUE(problem) << problem.error().message();
  auto problem_cases = problem->Collect();
  ASSERT_TRUE(problem_cases);
  ASSERT_EQ(problem_cases->size(), 1U);
  EXPECT_EQ((*problem_cases)[0]->Coordinate(), "final");

  auto driver = reader_->GetCases("driver");
  ASSERT_TRUE(driver);
  EXPECT_EQ(driver->Size(), 12U);
}

TEST_F(CaseReaderTest, GetCasesNested) {
  auto tree = reader_->GetCasesNested(test::DriverCoordinate(0), true);
  ASSERT_TRUE(tree) << tree.error().message();
  ASSERT_EQ(tree->size(), 1U);
  const CaseNode& driver = (*tree)[0];
  EXPECT_EQ(driver.value->Coordinate(), test::DriverCoordinate(0));
  ASSERT_EQ(driver.children.size(), 1U);
  EXPECT_EQ(driver.children[0].value->Source(), "root");
  EXPECT_EQ(*driver.children[0].value->Get("y1"), NdArray::Scalar(test::SellarY1(0)));
}

TEST_F(CaseReaderTest, ListSourceVars) {
  auto root = reader_->ListSourceVars("root");
  ASSERT_TRUE(root) << root.error().message();
  EXPECT_EQ(root->inputs, std::vector<std::string>({"mda.d1.x", "mda.d1.z", "mda.d2.z", "obj_cmp.y1"}));
  EXPECT_EQ(root->outputs, std::vector<std::string>({"mda.d1.y1", "mda.d2.y2", "obj_cmp.obj", "px.x", "pz.z"}));
  EXPECT_EQ(root->residuals, root->outputs);

  auto driver = reader_->ListSourceVars("driver");
  ASSERT_TRUE(driver);
  EXPECT_TRUE(driver->inputs.empty());
  EXPECT_EQ(driver->outputs,
            std::vector<std::string>({"con_cmp1.con1", "con_cmp2.con2", "obj_cmp.obj", "px.x", "pz.z"}));
  EXPECT_TRUE(driver->residuals.empty());

  auto solver = reader_->ListSourceVars(test::MdaSolverCoordinate(0, 0));
  ASSERT_TRUE(solver) << solver.error().message();
  EXPECT_TRUE(solver->inputs.empty());
  EXPECT_EQ(solver->outputs, std::vector<std::string>({"mda.d1.y1", "mda.d2.y2"}));

  EXPECT_EQ(reader_->ListSourceVars("root.nothing").error().code(), ErrorCode::kSourceNotFound);
}

TEST_F(CaseReaderTest, ListInputsOfLatestSystems) {
  auto inputs = reader_->ListInputs();
  ASSERT_TRUE(inputs) << inputs.error().message();
  EXPECT_EQ(Names(*inputs), std::vector<std::string>({"mda.d1.x", "mda.d1.z", "mda.d2.z", "obj_cmp.y1"}));

  const VariableListing& x = (*inputs)[0];
  EXPECT_EQ(x.promoted_name, std::optional<std::string>("x"));
  EXPECT_EQ(x.value, NdArray::Scalar(test::SellarX(1)));
  EXPECT_FALSE(x.residuals);

  const VariableListing& y1 = (*inputs)[3];
  ASSERT_TRUE(y1.units);
  EXPECT_EQ(*y1.units, "m");
  EXPECT_EQ(y1.value, NdArray::Scalar(test::SellarY1(1)));
}

TEST_F(CaseReaderTest, ListOutputsOrdersExplicitFirst) {
  auto outputs = reader_->ListOutputs();
  ASSERT_TRUE(outputs) << outputs.error().message();
  EXPECT_EQ(Names(*outputs), std::vector<std::string>({"mda.d1.y1", "obj_cmp.obj", "px.x", "pz.z", "mda.d2.y2"}));

  const VariableListing& z = (*outputs)[3];
  EXPECT_EQ(z.value, test::SellarZ(1));
  EXPECT_EQ(z.shape, std::vector<size_t>({2}));
  EXPECT_EQ(z.lower, NdArray({2}, {-10.0, 0.0}));
  EXPECT_EQ(z.upper, NdArray({2}, {10.0, 10.0}));
  EXPECT_EQ(z.residuals, NdArray({2}, {0.0, 0.0}));
  EXPECT_TRUE(z.explicit_output);

  const VariableListing& y2 = (*outputs)[4];
  EXPECT_FALSE(y2.explicit_output);
  EXPECT_EQ(y2.residuals, NdArray::Scalar(test::SellarY2Residual(1)));
  EXPECT_EQ(y2.res_ref, NdArray({1}, {1.0}));
}

TEST_F(CaseReaderTest, ListOutputsFilters) {
  OutputListOptions explicit_only;
  explicit_only.implicit_outputs = false;
  auto explicit_outputs = reader_->ListOutputs(nullptr, explicit_only);
  ASSERT_TRUE(explicit_outputs);
  EXPECT_EQ(Names(*explicit_outputs), std::vector<std::string>({"mda.d1.y1", "obj_cmp.obj", "px.x", "pz.z"}));

  OutputListOptions implicit_only;
  implicit_only.explicit_outputs = false;
  auto implicit_outputs = reader_->ListOutputs(nullptr, implicit_only);
  ASSERT_TRUE(implicit_outputs);
  EXPECT_EQ(Names(*implicit_outputs), std::vector<std::string>({"mda.d2.y2"}));

  OutputListOptions converged;
  converged.residuals_tol = 1e-4;
  auto unconverged = reader_->ListOutputs(nullptr, converged);
  ASSERT_TRUE(unconverged);
  EXPECT_EQ(Names(*unconverged), std::vector<std::string>({"mda.d2.y2"}));

  OutputListOptions nothing;
  nothing.explicit_outputs = false;
  nothing.implicit_outputs = false;
  auto rejected = reader_->ListOutputs(nullptr, nothing);
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(CaseReaderTest, ListVariablesOfOneCase) {
  auto driver = reader_->GetCase(test::DriverCoordinate(0));
  ASSERT_TRUE(driver);

  auto outputs = reader_->ListOutputs(driver->get());
  ASSERT_TRUE(outputs) << outputs.error().message();
  EXPECT_EQ(Names(*outputs),
            std::vector<std::string>({"con_cmp1.con1", "con_cmp2.con2", "obj_cmp.obj", "px.x", "pz.z"}));
  EXPECT_EQ((*outputs)[0].promoted_name, std::optional<std::string>("con1"));
  EXPECT_FALSE((*outputs)[0].residuals);

  auto inputs = reader_->ListInputs(driver->get());
  ASSERT_TRUE(inputs);
  EXPECT_TRUE(inputs->empty());
}

TEST_F(CaseReaderTest, LoadCasesFillsCaches) {
  ASSERT_TRUE(reader_->LoadCases());
  EXPECT_EQ(reader_->Store(Category::kDriver).CacheSize(), 2U);
  EXPECT_EQ(reader_->Store(Category::kDriverDerivative).CacheSize(), 2U);
  EXPECT_EQ(reader_->Store(Category::kSystem).CacheSize(), 4U);
  EXPECT_EQ(reader_->Store(Category::kSolver).CacheSize(), 6U);
  EXPECT_EQ(reader_->Store(Category::kProblem).CacheSize(), 1U);

  casereader::config::ReaderConfig config;
  config.preload = true;
  auto preloaded = OpenReader(config);
  ASSERT_TRUE(preloaded);
  EXPECT_EQ(preloaded->Store(Category::kSolver).CacheSize(), 6U);
}

TEST_F(CaseReaderTest, AuxiliaryMetadata) {
  auto missing = reader_->SystemMetadata("root");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kNotFound);
}

TEST(CaseReaderOpenTest, EmptyStore) {
  StoreBuilder builder("reader_empty", 4);
  builder.Finish();
  auto reader = CaseReader::Open(builder.Path());
  ASSERT_TRUE(reader) << reader.error().message();

  EXPECT_TRUE((*reader)->ListSources().empty());
  auto cases = (*reader)->ListCases("", true);
  ASSERT_TRUE(cases);
  EXPECT_TRUE(cases->empty());
  EXPECT_EQ((*reader)->ListCases("driver", false)->size(), 0U);

  auto inputs = (*reader)->ListInputs();
  ASSERT_TRUE(inputs);
  EXPECT_TRUE(inputs->empty());
}

TEST(CaseReaderOpenTest, MissingFile) {
  auto reader = CaseReader::Open("/nonexistent/casereader_missing.sqlite");
  ASSERT_FALSE(reader);
  EXPECT_EQ(reader.error().code(), ErrorCode::kInvalidStore);
}

TEST(CaseReaderOpenTest, NotASqliteFile) {
  std::string path = (std::filesystem::temp_directory_path() / "casereader_not_sqlite.sqlite").string();
  {
    std::ofstream ofs(path);
    ofs << "this is plain text, not a database file header at all\n";
  }
  auto reader = CaseReader::Open(path);
  ASSERT_FALSE(reader);
  EXPECT_EQ(reader.error().code(), ErrorCode::kInvalidStore);
  std::remove(path.c_str());
}

TEST_F(CaseReaderTest, EveryListedCaseCanBeFetched) {
  for (const auto& source : reader_->ListSources()) {
    for (const auto& coordinate : Cases(source, true)) {
      auto fetched = reader_->GetCase(coordinate);
      ASSERT_TRUE(fetched) << coordinate << ": " << fetched.error().message();
      EXPECT_EQ((*fetched)->Coordinate(), coordinate);
    }
    for (const auto& coordinate : Cases(source, false)) {
      auto fetched = reader_->GetCase(coordinate);
      ASSERT_TRUE(fetched) << coordinate << ": " << fetched.error().message();
      EXPECT_EQ((*fetched)->Source(), source);
    }
  }
}
