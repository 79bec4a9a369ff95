/*
 * Copyright 2025-2026 matchbench project.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <gtest/gtest.h>

#include <map>
#include <set>
#include <string>

#include <matchbench/exception.h>
#include <matchbench/dataset/generators.h>

namespace matchbench::testing {

using namespace matchbench::dataset;

class GeneratorTest : public ::testing::Test {
    void SetUp() override {
        std::vector<reference_entry> accounts{};
        for (std::size_t i = 0; i < 100; ++i) {
            accounts.emplace_back(reference_entry{generate_account(i).id, {}});
        }
        references_.populate(entity_type::account, std::move(accounts));

        std::vector<reference_entry> groups{};
        for (std::size_t i = 0; i < 20; ++i) {
            groups.emplace_back(reference_entry{generate_account_group(i).id, {}});
        }
        references_.populate(entity_type::account_group, std::move(groups));

        std::vector<reference_entry> skills{};
        for (std::size_t i = 0; i < 50; ++i) {
            auto skill = generate_skill(i);
            skills.emplace_back(reference_entry{skill.id, skill.code});
        }
        references_.populate(entity_type::skill, std::move(skills));
    }
protected:
    reference_index references_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)
};

TEST_F(GeneratorTest, names) {
    EXPECT_EQ(1, generate_account(0).id);
    EXPECT_EQ("Account_1", generate_account(0).name);
    EXPECT_EQ("Account_100", generate_account(99).name);
    EXPECT_EQ("Group_7", generate_account_group(6).name);
    EXPECT_EQ(42, generate_task(41).id);
    EXPECT_EQ(distribution_group_state::waiting, generate_distribution_group(5).state);
}

TEST_F(GeneratorTest, skill_codes) {
    EXPECT_EQ(90U, max_skill_count());

    auto first = generate_skill(0);
    EXPECT_EQ("SKILL_EN_KO", first.code);
    EXPECT_EQ("EN", first.source_language);
    EXPECT_EQ("KO", first.target_language);
    EXPECT_EQ(translation_type::subtitle, first.type);

    EXPECT_EQ("SKILL_EN_RU", generate_skill(8).code);
    EXPECT_EQ("SKILL_KO_EN", generate_skill(9).code);
    EXPECT_EQ("SKILL_KO_JA", generate_skill(10).code);
    EXPECT_EQ("SKILL_RU_IT", generate_skill(89).code);

    std::set<std::string> codes{};
    for (std::size_t i = 0; i < max_skill_count(); ++i) {
        auto skill = generate_skill(i);
        EXPECT_NE(skill.source_language, skill.target_language);
        codes.emplace(skill.code);
    }
    EXPECT_EQ(90U, codes.size());

    EXPECT_THROW(generate_skill(90), configuration_error);
}

TEST_F(GeneratorTest, account_group_links) {
    random_generator rnd{12345};
    for (std::size_t i = 0; i < 100; ++i) {
        auto links = generate_account_group_links(i, references_, rnd);
        ASSERT_GE(links.size(), 1U);
        ASSERT_LE(links.size(), 3U);
        std::set<std::int64_t> groups{};
        for (auto const& link : links) {
            EXPECT_EQ(static_cast<std::int64_t>(i + 1), link.account_id);
            EXPECT_GE(link.account_group_id, 1);
            EXPECT_LE(link.account_group_id, 20);
            groups.emplace(link.account_group_id);
        }
        EXPECT_EQ(links.size(), groups.size());
    }
}

TEST_F(GeneratorTest, account_skills) {
    random_generator rnd{12345};
    for (std::size_t i = 0; i < 100; ++i) {
        auto links = generate_account_skills(i, references_, rnd);
        ASSERT_GE(links.size(), 1U);
        ASSERT_LE(links.size(), 5U);
        std::set<std::int64_t> skills{};
        for (auto const& link : links) {
            EXPECT_EQ(generate_skill(static_cast<std::size_t>(link.skill_id - 1)).code, link.skill_code);
            skills.emplace(link.skill_id);
        }
        EXPECT_EQ(links.size(), skills.size());
    }
}

TEST_F(GeneratorTest, links_never_exceed_population) {
    reference_index small{};
    small.populate(entity_type::account, {{1, {}}});
    small.populate(entity_type::account_group, {{1, {}}});
    small.populate(entity_type::skill, {{1, "SKILL_EN_KO"}, {2, "SKILL_EN_JA"}});

    random_generator rnd{7};
    for (int n = 0; n < 50; ++n) {
        auto groups = generate_account_group_links(0, small, rnd);
        ASSERT_EQ(1U, groups.size());
        EXPECT_EQ(1, groups[0].account_group_id);
        auto skills = generate_account_skills(0, small, rnd);
        EXPECT_LE(skills.size(), 2U);
    }
}

TEST_F(GeneratorTest, same_seed_same_links) {
    random_generator a{99};
    random_generator b{99};
    for (std::size_t i = 0; i < 100; ++i) {
        auto la = generate_account_skills(i, references_, a);
        auto lb = generate_account_skills(i, references_, b);
        ASSERT_EQ(la.size(), lb.size());
        for (std::size_t j = 0; j < la.size(); ++j) {
            EXPECT_EQ(la[j].skill_id, lb[j].skill_id);
        }
    }
}

TEST_F(GeneratorTest, matching_type_cycle) {
    EXPECT_EQ(matching_type::account_id, matching_type_for(1));
    EXPECT_EQ(matching_type::account_group_id, matching_type_for(2));
    EXPECT_EQ(matching_type::skill_code, matching_type_for(3));
    EXPECT_EQ(matching_type::account_id, matching_type_for(4));
    EXPECT_EQ(matching_type::skill_code, matching_type_for(999999));
}

TEST_F(GeneratorTest, matching_pointers) {
    auto m1 = generate_distribution_group_matching(0, references_);
    EXPECT_EQ(1, m1.id);
    EXPECT_EQ(1, m1.distribution_group_id);
    EXPECT_EQ(matching_type::account_id, m1.type());
    EXPECT_EQ("2", to_text(m1.pointer));  // (1 mod 100) + 1

    auto m2 = generate_distribution_group_matching(1, references_);
    EXPECT_EQ(matching_type::account_group_id, m2.type());
    EXPECT_EQ("3", to_text(m2.pointer));  // (2 mod 20) + 1

    auto m3 = generate_distribution_group_matching(2, references_);
    EXPECT_EQ(matching_type::skill_code, m3.type());
    EXPECT_EQ(generate_skill(3).code, to_text(m3.pointer));  // skills[3 mod 50]

    auto m100 = generate_distribution_group_matching(99, references_);
    EXPECT_EQ(matching_type::account_id, m100.type());
    EXPECT_EQ("1", to_text(m100.pointer));  // (100 mod 100) + 1
}

TEST_F(GeneratorTest, matching_distribution) {
    std::map<matching_type, std::size_t> counts{};
    for (std::size_t i = 0; i < 1000; ++i) {
        ++counts[generate_distribution_group_matching(i, references_).type()];
    }
    EXPECT_EQ(334U, counts[matching_type::account_id]);
    EXPECT_EQ(333U, counts[matching_type::account_group_id]);
    EXPECT_EQ(333U, counts[matching_type::skill_code]);
}

TEST_F(GeneratorTest, missing_dependency) {
    reference_index empty{};
    random_generator rnd{1};
    EXPECT_THROW(generate_account_group_links(0, empty, rnd), dependency_error);
    EXPECT_THROW(generate_account_skills(0, empty, rnd), dependency_error);
    EXPECT_THROW(generate_distribution_group_matching(0, empty), dependency_error);
    EXPECT_THROW(generate_distribution_group_matching(1, empty), dependency_error);
    EXPECT_THROW(generate_distribution_group_matching(2, empty), dependency_error);
}

TEST_F(GeneratorTest, distribution_group_task) {
    auto link = generate_distribution_group_task(41);
    EXPECT_EQ(42, link.id);
    EXPECT_EQ(42, link.distribution_group_id);
    EXPECT_EQ(42, link.task_id);
}

}  // namespace matchbench::testing
