// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
#include "equivalency/steps/data_set_step.h"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/base/no_destructor.h"
#include "absl/log/check.h"
#include "absl/status/status_matchers.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/data/data_relation.h"
#include "equivalency/data/data_set.h"
#include "equivalency/data/data_table.h"
#include "equivalency/equivalency.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/member_path.h"
#include "equivalency/record.h"
#include "equivalency/test_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

using ::absl_testing::IsOkAndHolds;
using ::equivalency::data::DataRelation;
using ::equivalency::data::DataSet;
using ::equivalency::data::DataSetType;
using ::equivalency::data::DataTable;
using ::equivalency::data::SchemaSerializationMode;
using ::equivalency::data::SerializationFormat;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAreArray;

std::shared_ptr<DataSet> MakeDataSet(
    std::vector<std::shared_ptr<DataTable>> tables,
    const Type& type = DataSetType()) {
  auto data_set = std::make_shared<DataSet>("Shop", type);
  for (auto& table : tables) {
    CHECK_OK(data_set->AddTable(std::move(table)));
  }
  return data_set;
}

// Customers table whose second customer is called `second_name`.
std::shared_ptr<DataTable> MakeCustomersTable(std::string second_name) {
  auto table = DataTable::Create("Customers");
  CHECK_OK(table->AddColumn("Id", Int64Type()).status());
  CHECK_OK(table->AddColumn("Name", StringType()).status());
  CHECK_OK(table->SetPrimaryKey({"Id"}));
  CHECK_OK(table->AddRow({Value(1), Value("Ada")}).status());
  CHECK_OK(table->AddRow({Value(2), Value(std::move(second_name))}).status());
  return table;
}

TEST(DataSetEquivalencyStepTest, CanHandle) {
  DataSetEquivalencyStep step;
  EquivalencyOptions options;
  auto shop = test::MakeShopDataSet();
  EXPECT_TRUE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(), Value(shop), ObjectType()),
      options));
  EXPECT_TRUE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(shop), Value(), DataSetType()),
      options));
  EXPECT_TRUE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(), Value(),
                                   test::ShopDataSetType()),
      options));
  EXPECT_FALSE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(shop), Value(), ObjectType()),
      options));
  EXPECT_FALSE(step.CanHandle(
      EquivalencyValidationContext(
          Node(), Value(shop), Value(test::MakeAddress("Main St", "Paris")),
          ObjectType()),
      options));
  EXPECT_EQ(step.ToString(), "Compare DataSets");
}

TEST(DataSetEquivalencyStepTest, EqualDataSets) {
  EXPECT_THAT(FindEquivalencyFailures(Value(test::MakeShopDataSet()),
                                      Value(test::MakeShopDataSet())),
              IsOkAndHolds(IsEmpty()));
}

struct ScalarCase {
  std::string name;
  std::function<void(DataSet&)> mutate;
  std::string message;
};

class DataSetScalarTest : public ::testing::TestWithParam<ScalarCase> {};

TEST_P(DataSetScalarTest, OneFailurePerDifferingProperty) {
  auto subject = test::MakeShopDataSet();
  GetParam().mutate(*subject);
  EXPECT_THAT(FindEquivalencyFailures(Value(subject),
                                      Value(test::MakeShopDataSet())),
              IsOkAndHolds(ElementsAre(Failure{"", GetParam().message})));
}

INSTANTIATE_TEST_SUITE_P(
    Properties, DataSetScalarTest,
    ::testing::Values(
        ScalarCase{"DataSetName",
                   [](DataSet& ds) { ds.set_name("Store"); },
                   "Expected DataSet to have DataSetName 'Shop', but found "
                   "'Store' instead"},
        ScalarCase{"CaseSensitive",
                   [](DataSet& ds) { ds.set_case_sensitive(true); },
                   "Expected DataSet to have CaseSensitive value of 'false', "
                   "but found 'true' instead"},
        ScalarCase{"EnforceConstraints",
                   [](DataSet& ds) { ds.set_enforce_constraints(false); },
                   "Expected DataSet to have EnforceConstraints value of "
                   "'true', but found 'false' instead"},
        ScalarCase{"Locale", [](DataSet& ds) { ds.set_locale("de-DE"); },
                   "Expected DataSet to have Locale value of 'en-US', but "
                   "found 'de-DE' instead"},
        ScalarCase{"Namespace",
                   [](DataSet& ds) { ds.set_namespace_uri("urn:shop"); },
                   "Expected DataSet to have Namespace value of '', but found "
                   "'urn:shop' instead"},
        ScalarCase{"Prefix", [](DataSet& ds) { ds.set_prefix("s"); },
                   "Expected DataSet to have Prefix value of '', but found "
                   "'s' instead"},
        ScalarCase{"RemotingFormat",
                   [](DataSet& ds) {
                     ds.set_remoting_format(SerializationFormat::kBinary);
                   },
                   "Expected DataSet to have RemotingFormat value of 'Xml', "
                   "but found 'Binary' instead"},
        ScalarCase{"SchemaSerializationMode",
                   [](DataSet& ds) {
                     ds.set_schema_serialization_mode(
                         SchemaSerializationMode::kExcludeSchema);
                   },
                   "Expected DataSet to have SchemaSerializationMode value of "
                   "'IncludeSchema', but found 'ExcludeSchema' instead"}),
    [](const ::testing::TestParamInfo<ScalarCase>& info) {
      return info.param.name;
    });

TEST(DataSetEquivalencyStepTest, AllScalarMismatchesAreReported) {
  auto subject = test::MakeShopDataSet();
  subject->set_name("Store").set_locale("de-DE").set_prefix("s");
  ASSERT_OK_AND_ASSIGN(
      std::vector<Failure> failures,
      FindEquivalencyFailures(Value(subject), Value(test::MakeShopDataSet())));
  EXPECT_EQ(failures.size(), 3);
}

TEST(DataSetEquivalencyStepTest, ExcludedScalarIsNotReported) {
  auto subject = test::MakeShopDataSet();
  subject->set_locale("de-DE").set_prefix("s");
  EquivalencyOptions options;
  options.Excluding(MemberPath("Locale"));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(test::MakeShopDataSet()),
                              options),
      IsOkAndHolds(ElementsAre(Failure{
          "", "Expected DataSet to have Prefix value of '', but found 's' "
              "instead"})));
}

TEST(DataSetEquivalencyStepTest, TableOrderDoesNotMatter) {
  auto expectation = MakeDataSet(
      {MakeCustomersTable("Grace Hopper"), test::MakeOrdersTable()});
  ASSERT_OK_AND_ASSIGN(
      std::vector<Failure> in_order,
      FindEquivalencyFailures(
          Value(MakeDataSet(
              {MakeCustomersTable("Grace"), test::MakeOrdersTable()})),
          Value(expectation)));
  ASSERT_OK_AND_ASSIGN(
      std::vector<Failure> reversed,
      FindEquivalencyFailures(
          Value(MakeDataSet(
              {test::MakeOrdersTable(), MakeCustomersTable("Grace")})),
          Value(expectation)));
  EXPECT_THAT(
      in_order,
      ElementsAre(Failure{
          "Tables[Customers].Rows[1][Name]",
          "Expected item Tables[Customers].Rows[1][Name] to be \"Grace "
          "Hopper\" with a length of 12, but \"Grace\" has a length of 5, "
          "differs near index 5."}));
  EXPECT_THAT(reversed, UnorderedElementsAreArray(in_order));

  EXPECT_THAT(
      FindEquivalencyFailures(
          Value(MakeDataSet({test::MakeOrdersTable(),
                             test::MakeCustomersTable()})),
          Value(MakeDataSet({test::MakeCustomersTable(),
                             test::MakeOrdersTable()}))),
      IsOkAndHolds(IsEmpty()));
}

TEST(DataSetEquivalencyStepTest, MissingAndUnexpectedTables) {
  auto expectation =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()});
  auto subject =
      MakeDataSet({test::MakeCustomersTable(), DataTable::Create("Audit")});
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation)),
      IsOkAndHolds(ElementsAre(
          Failure{"", "Expected DataSet to contain table 'Orders', but did "
                      "not find it"},
          Failure{"", "Found unexpected table 'Audit' in DataSet"})));
}

TEST(DataSetEquivalencyStepTest, TableCount) {
  EXPECT_THAT(
      FindEquivalencyFailures(
          Value(MakeDataSet({test::MakeCustomersTable()})),
          Value(MakeDataSet(
              {test::MakeCustomersTable(), test::MakeOrdersTable()}))),
      IsOkAndHolds(ElementsAre(
          Failure{"", "Expected DataSet to contain 2, but found 1 table(s)"},
          Failure{"", "Expected DataSet to contain table 'Orders', but did "
                      "not find it"})));
}

TEST(DataSetEquivalencyStepTest, ExcludedTables) {
  auto expectation =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()});
  EquivalencyOptions options;
  options.ExcludingTables({"Orders", "Audit"});

  // Differing contents.
  EXPECT_THAT(FindEquivalencyFailures(
                  Value(MakeDataSet({test::MakeCustomersTable(),
                                     DataTable::Create("Orders")})),
                  Value(expectation), options),
              IsOkAndHolds(IsEmpty()));
  // Presence and absence.
  EXPECT_THAT(FindEquivalencyFailures(
                  Value(MakeDataSet({test::MakeCustomersTable(),
                                     DataTable::Create("Audit")})),
                  Value(expectation), options),
              IsOkAndHolds(IsEmpty()));
}

TEST(DataSetEquivalencyStepTest, ConcreteTypes) {
  auto data_set =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()});
  auto shop_data_set =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()},
                  test::ShopDataSetType());

  EXPECT_THAT(FindEquivalencyFailures(Value(shop_data_set), Value(data_set)),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected DataSet to be of type 'DataSet', but found "
                      "'ShopDataSet'"})));
  EXPECT_THAT(FindEquivalencyFailures(Value(data_set), Value(shop_data_set)),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected DataSet to be of type 'ShopDataSet', but "
                      "found 'DataSet'"})));

  EquivalencyOptions options;
  options.AllowingMismatchedTypes();
  EXPECT_THAT(
      FindEquivalencyFailures(Value(shop_data_set), Value(data_set), options),
      IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(data_set), Value(shop_data_set), options),
      IsOkAndHolds(IsEmpty()));
}

TEST(DataSetEquivalencyStepTest, Nulls) {
  auto shop = test::MakeShopDataSet();
  EXPECT_THAT(FindEquivalencyFailures(Value(), Value(), DataSetType()),
              IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(shop), Value(), DataSetType()),
      IsOkAndHolds(ElementsAre(Failure{
          "", "Expected DataSet value to be null, but found DataSet(Shop)"})));
  EXPECT_THAT(FindEquivalencyFailures(Value(), Value(shop), DataSetType()),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected DataSet to be non-null, but found null"})));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(test::MakeAddress("Main St", "Paris")),
                              Value(shop), DataSetType()),
      IsOkAndHolds(ElementsAre(Failure{
          "", "Expected DataSet to be of type DataSet, but found Address "
              "instead"})));
}

TEST(DataSetEquivalencyStepTest, TableSettingsFollowDataSetExclusions) {
  auto expectation =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()});
  auto subject =
      MakeDataSet({test::MakeCustomersTable(), test::MakeOrdersTable()},
                  test::ShopDataSetType());
  subject->set_locale("de-DE");
  subject->tables()[0]->set_locale("de-DE");

  EquivalencyOptions options;
  options.Excluding(MemberPath("Locale"));
  EquivalencyOptions mismatched_types = options;
  mismatched_types.AllowingMismatchedTypes();

  EXPECT_THAT(FindEquivalencyFailures(Value(subject), Value(expectation),
                                      mismatched_types),
              IsOkAndHolds(IsEmpty()));
  // Running again with the same options gives the same result.
  EXPECT_THAT(FindEquivalencyFailures(Value(subject), Value(expectation),
                                      mismatched_types),
              IsOkAndHolds(IsEmpty()));
  EXPECT_EQ(mismatched_types.selection_rules().size(), 2);

  // Without mismatched types only the DataSet property is excluded.
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation), options),
      IsOkAndHolds(ElementsAre(
          Failure{"", "Expected DataSet to be of type 'DataSet', but found "
                      "'ShopDataSet'"},
          Failure{"Tables[Customers]",
                  "Expected item Tables[Customers] to have Locale value of "
                  "'en-US', but found 'de-DE' instead"})));
}

TEST(DataSetEquivalencyStepTest, TableSettingsAreNotExcludedWhenSelected) {
  auto expectation = test::MakeShopDataSet();
  auto subject = test::MakeShopDataSet();
  subject->tables()[1]->set_case_sensitive(true);
  EquivalencyOptions options;
  options.AllowingMismatchedTypes();
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation), options),
      IsOkAndHolds(ElementsAre(Failure{
          "Tables[Orders]",
          "Expected item Tables[Orders] to have CaseSensitive value of "
          "'false', but found 'true' instead"})));
}

TEST(DataSetEquivalencyStepTest, Relations) {
  auto subject = MakeDataSet(
      {test::MakeCustomersTable(), test::MakeOrdersTable()});
  CHECK_OK(subject->AddRelation(std::make_shared<DataRelation>(
      "OrdersByCustomer", "Customers", std::vector<std::string>{"Id"},
      "Orders", std::vector<std::string>{"CustomerId"})));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(test::MakeShopDataSet())),
      IsOkAndHolds(ElementsAre(Failure{
          "Relations[0].RelationName",
          "Expected member Relations[0].RelationName to be "
          "\"CustomerOrders\" with a length of 14, but \"OrdersByCustomer\" "
          "has a length of 16, differs near index 0."})));
}

TEST(DataSetEquivalencyStepTest, ExtendedProperties) {
  auto subject = test::MakeShopDataSet();
  subject->extended_properties()->Set(Value("owner"), Value("ops"));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(test::MakeShopDataSet())),
      IsOkAndHolds(ElementsAre(Failure{
          "ExtendedProperties",
          "Expected member ExtendedProperties not to contain key \"owner\", "
          "but found it."})));
}

TEST(DataSetEquivalencyStepTest, Reason) {
  auto subject = test::MakeShopDataSet();
  subject->set_name("Store");
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(test::MakeShopDataSet()),
                              EquivalencyOptions(), "the shop was renamed"),
      IsOkAndHolds(ElementsAre(Failure{
          "", "Expected DataSet to have DataSetName 'Shop' because the shop "
              "was renamed, but found 'Store' instead"})));
}

TEST(DataSetEquivalencyStepTest, NestedInRecord) {
  static const absl::NoDestructor<std::unique_ptr<const Type>> kBackupType(
      Type::Builder("Backup").AddField("Data", DataSetType()).Build());
  auto subject = Record::Create(**kBackupType);
  subject->Set("Data", Value(test::MakeShopDataSet()));
  auto expectation = Record::Create(**kBackupType);
  auto data_set = test::MakeShopDataSet();
  data_set->set_prefix("b");
  expectation->Set("Data", Value(data_set));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation)),
      IsOkAndHolds(ElementsAre(Failure{
          "Data", "Expected member Data to have Prefix value of 'b', but "
                  "found '' instead"})));
}

}  // namespace
}  // namespace equivalency::steps
