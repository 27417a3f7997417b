#include <gtest/gtest.h>
#include "../include/genetic.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>

class GeneticTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 4-region RGB target image
        image = cv::Mat::zeros(40, 40, CV_8UC3);
        cv::rectangle(image, cv::Point(0, 0), cv::Point(19, 19), cv::Scalar(255, 0, 0), -1);     // Red
        cv::rectangle(image, cv::Point(20, 0), cv::Point(39, 19), cv::Scalar(0, 255, 0), -1);    // Green
        cv::rectangle(image, cv::Point(0, 20), cv::Point(19, 39), cv::Scalar(0, 0, 255), -1);    // Blue
        cv::rectangle(image, cv::Point(20, 20), cv::Point(39, 39), cv::Scalar(250, 250, 250), -1); // White

        config.n_colors = 4;
        config.population_size = 8;
        config.cluster_restarts = 2;
        config.seed = 123;
    }

    static bool sameScheme(const Scheme& a, const Scheme& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
    }

    static bool containsScheme(const std::vector<Individual>& population, const Scheme& scheme) {
        for (const Individual& ind : population) {
            if (sameScheme(ind.scheme, scheme)) return true;
        }
        return false;
    }

    // child == a[0:p1] + b[p1:p2] + a[p2:N] for some cut points 1 <= p1 < p2 <= N-1
    static bool isTwoPointChild(const Scheme& child, const Scheme& a, const Scheme& b) {
        int n = (int)child.size();
        for (int p1 = 1; p1 < n; ++p1) {
            for (int p2 = p1 + 1; p2 < n; ++p2) {
                Scheme expected(a.begin(), a.begin() + p1);
                expected.insert(expected.end(), b.begin() + p1, b.begin() + p2);
                expected.insert(expected.end(), a.begin() + p2, a.end());
                if (sameScheme(child, expected)) return true;
            }
        }
        return false;
    }

    std::vector<double> randomScores(std::mt19937& gen, int count) {
        std::uniform_real_distribution<double> dist(0.0, 10.0);
        std::vector<double> scores(count);
        for (double& s : scores) s = dist(gen);
        return scores;
    }

    cv::Mat image;
    GeneticConfig config;
};

TEST_F(GeneticTest, InitialPopulationPermutesCandidateColors) {
    GeneticColorOptimizer optimizer(image, config);
    std::vector<cv::Vec3b> pool = defaultCandidateColors();
    Scheme expected(pool.begin(), pool.begin() + 4);
    std::sort(expected.begin(), expected.end(), [](const cv::Vec3b& a, const cv::Vec3b& b) {
        return std::lexicographical_compare(a.val, a.val + 3, b.val, b.val + 3);
    });

    ASSERT_EQ((int)optimizer.population().size(), config.population_size);
    for (const Individual& ind : optimizer.population()) {
        EXPECT_DOUBLE_EQ(ind.score, NEUTRAL_SCORE);
        Scheme sorted = ind.scheme;
        std::sort(sorted.begin(), sorted.end(), [](const cv::Vec3b& a, const cv::Vec3b& b) {
            return std::lexicographical_compare(a.val, a.val + 3, b.val, b.val + 3);
        });
        EXPECT_TRUE(sameScheme(sorted, expected));
    }
    EXPECT_EQ(optimizer.generation(), 0);
    EXPECT_TRUE(optimizer.history().empty());
}

TEST_F(GeneticTest, SegmentationFollowsImageRegions) {
    GeneticColorOptimizer optimizer(image, config);
    const std::vector<int>& labels = optimizer.labels();

    ASSERT_EQ(labels.size(), image.total());
    for (int label : labels) {
        EXPECT_GE(label, 0);
        EXPECT_LT(label, 4);
    }

    // Each region is one label, and the four regions get four different labels
    int tl = labels[0], tr = labels[39], bl = labels[39 * 40], br = labels[39 * 40 + 39];
    EXPECT_EQ(labels[5 * 40 + 5], tl);
    EXPECT_EQ(labels[5 * 40 + 30], tr);
    EXPECT_EQ(labels[30 * 40 + 5], bl);
    EXPECT_EQ(labels[30 * 40 + 30], br);
    std::vector<int> corners = { tl, tr, bl, br };
    std::sort(corners.begin(), corners.end());
    EXPECT_EQ(std::unique(corners.begin(), corners.end()), corners.end());
}

TEST_F(GeneticTest, ApplySchemeRecolorsEveryPixelByLabel) {
    GeneticColorOptimizer optimizer(image, config);
    Scheme scheme = { cv::Vec3b(10, 20, 30), cv::Vec3b(40, 50, 60), cv::Vec3b(70, 80, 90), cv::Vec3b(100, 110, 120) };

    cv::Mat out = optimizer.applyScheme(scheme);

    ASSERT_EQ(out.size(), image.size());
    ASSERT_EQ(out.type(), CV_8UC3);
    for (int r = 0; r < out.rows; ++r) {
        for (int c = 0; c < out.cols; ++c)
            ASSERT_EQ(out.at<cv::Vec3b>(r, c), scheme[optimizer.labels()[r * out.cols + c]]);
    }
}

TEST_F(GeneticTest, ApplySchemeRejectsWrongLength) {
    GeneticColorOptimizer optimizer(image, config);
    Scheme tooShort = { cv::Vec3b(1, 2, 3) };

    EXPECT_THROW(optimizer.applyScheme(tooShort), std::invalid_argument);
}

TEST_F(GeneticTest, SetScoresRequiresOneScorePerScheme) {
    GeneticColorOptimizer optimizer(image, config);

    EXPECT_THROW(optimizer.setScores(std::vector<double>(3, 9.0)), std::invalid_argument);
    for (double s : optimizer.scores())
        EXPECT_DOUBLE_EQ(s, NEUTRAL_SCORE); // Nothing was updated

    std::vector<double> scores = { 1, 2, 3, 4, 5, 6, 7, 8 };
    optimizer.setScores(scores);
    EXPECT_EQ(optimizer.scores(), scores);
}

TEST_F(GeneticTest, EvolveRejectsNegativeScores) {
    GeneticColorOptimizer optimizer(image, config);
    std::vector<double> scores(8, 5.0);
    scores[3] = -1.0;
    optimizer.setScores(scores);

    EXPECT_THROW(optimizer.evolve(), std::invalid_argument);
    EXPECT_EQ(optimizer.generation(), 0);
    EXPECT_TRUE(optimizer.history().empty());
}

TEST_F(GeneticTest, EvolveRejectsNonFiniteScores) {
    GeneticColorOptimizer optimizer(image, config);
    std::vector<double> scores(8, 5.0);
    scores[2] = std::numeric_limits<double>::quiet_NaN();
    optimizer.setScores(scores);
    EXPECT_THROW(optimizer.evolve(), std::invalid_argument);

    scores[2] = std::numeric_limits<double>::infinity();
    optimizer.setScores(scores);
    EXPECT_THROW(optimizer.evolve(), std::invalid_argument);
    EXPECT_EQ(optimizer.generation(), 0);
    EXPECT_TRUE(optimizer.history().empty());
}

TEST_F(GeneticTest, NeutralScoresPassTheSanityCheck) {
    GeneticColorOptimizer optimizer(image, config);

    EXPECT_NO_THROW(optimizer.evolve());
    EXPECT_EQ(optimizer.generation(), 1);
}

TEST_F(GeneticTest, PopulationSizeIsPreservedAcrossGenerations) {
    GeneticColorOptimizer optimizer(image, config);
    std::mt19937 gen(9);

    for (int g = 0; g < 15; ++g) {
        optimizer.setScores(randomScores(gen, config.population_size));
        optimizer.evolve();
        ASSERT_EQ((int)optimizer.population().size(), config.population_size);
        for (const Individual& ind : optimizer.population())
            ASSERT_EQ((int)ind.scheme.size(), config.n_colors);
    }
    EXPECT_EQ(optimizer.generation(), 15);
    EXPECT_EQ(optimizer.history().size(), 15u);
}

TEST_F(GeneticTest, ElitesSurviveUnchanged) {
    config.mutation_rate = 1.0;
    config.max_mutation_change = 0.5;
    GeneticColorOptimizer optimizer(image, config);

    std::vector<double> scores(8, 2.0);
    scores[2] = 9.0;
    scores[6] = 7.5; // Exactly the threshold counts as elite
    optimizer.setScores(scores);
    Scheme elite1 = optimizer.population()[2].scheme;
    Scheme elite2 = optimizer.population()[6].scheme;

    optimizer.evolve();

    EXPECT_TRUE(containsScheme(optimizer.population(), elite1));
    EXPECT_TRUE(containsScheme(optimizer.population(), elite2));
    // Elites are appended after the offspring
    EXPECT_TRUE(sameScheme(optimizer.population()[6].scheme, elite1));
    EXPECT_TRUE(sameScheme(optimizer.population()[7].scheme, elite2));
}

TEST_F(GeneticTest, EvolveRecordsHistoryAndResetsScores) {
    GeneticColorOptimizer optimizer(image, config);
    optimizer.setScores({ 1, 2, 3, 4, 5, 6, 7, 4 });

    optimizer.evolve();

    ASSERT_EQ(optimizer.history().size(), 1u);
    EXPECT_DOUBLE_EQ(optimizer.history()[0].average, 4.0);
    EXPECT_DOUBLE_EQ(optimizer.history()[0].best, 7.0);
    for (double s : optimizer.scores())
        EXPECT_DOUBLE_EQ(s, NEUTRAL_SCORE);
    EXPECT_EQ(optimizer.generation(), 1);
}

TEST_F(GeneticTest, CrossoverKeepsHeadAndTailOfOneParent) {
    config.mutation_rate = 0.0;
    GeneticColorOptimizer optimizer(image, config);

    // Two distinct schemes are the only ones with a non-zero score, so they are the only possible parents
    const std::vector<Individual>& initial = optimizer.population();
    int first = -1, second = -1;
    for (int i = 0; i < (int)initial.size() && second < 0; ++i) {
        for (int j = i + 1; j < (int)initial.size(); ++j) {
            if (!sameScheme(initial[i].scheme, initial[j].scheme)) {
                first = i;
                second = j;
                break;
            }
        }
    }
    ASSERT_GE(second, 0);

    Scheme a = initial[first].scheme;
    Scheme b = initial[second].scheme;
    std::vector<double> scores(config.population_size, 0.0);
    scores[first] = 1.0;
    scores[second] = 1.0;
    optimizer.setScores(scores);
    optimizer.evolve();

    // No elites at these scores: every member is an offspring of a and b
    for (const Individual& child : optimizer.population()) {
        ASSERT_EQ((int)child.scheme.size(), config.n_colors);
        bool headTailFromA = child.scheme.front() == a.front() && child.scheme.back() == a.back();
        bool headTailFromB = child.scheme.front() == b.front() && child.scheme.back() == b.back();
        EXPECT_TRUE(headTailFromA || headTailFromB);
        EXPECT_TRUE(isTwoPointChild(child.scheme, a, b) || isTwoPointChild(child.scheme, b, a) ||
            sameScheme(child.scheme, a) || sameScheme(child.scheme, b));
    }
}

TEST_F(GeneticTest, ShortSchemesAreClonedFromAParent) {
    config.n_colors = 2;
    config.mutation_rate = 0.0;
    GeneticColorOptimizer optimizer(image, config);
    std::vector<Individual> parents = optimizer.population();

    optimizer.setScores(std::vector<double>(8, 3.0));
    optimizer.evolve();

    for (const Individual& child : optimizer.population())
        EXPECT_TRUE(containsScheme(parents, child.scheme));
}

TEST_F(GeneticTest, MutationStaysWithinConfiguredChange) {
    config.mutation_rate = 1.0;
    config.max_mutation_change = 0.3;
    config.candidate_colors.assign(4, cv::Vec3b(100, 100, 100));
    GeneticColorOptimizer optimizer(image, config);

    optimizer.setScores(std::vector<double>(8, 1.0));
    optimizer.evolve();

    bool changed = false;
    for (const Individual& ind : optimizer.population()) {
        for (const cv::Vec3b& color : ind.scheme) {
            for (int ch = 0; ch < 3; ++ch) {
                EXPECT_GE(color[ch], 70);
                EXPECT_LE(color[ch], 130);
                changed = changed || color[ch] != 100;
            }
        }
    }
    EXPECT_TRUE(changed);
}

TEST_F(GeneticTest, MutationClampsToValidRange) {
    config.mutation_rate = 1.0;
    config.max_mutation_change = 1.0;
    config.candidate_colors.assign(4, cv::Vec3b(250, 250, 250));
    GeneticColorOptimizer optimizer(image, config);
    std::mt19937 gen(1);

    bool saturated = false;
    for (int g = 0; g < 3; ++g) {
        optimizer.setScores(randomScores(gen, config.population_size));
        optimizer.evolve();
        for (const Individual& ind : optimizer.population()) {
            for (const cv::Vec3b& color : ind.scheme)
                saturated = saturated || color[0] == 255 || color[1] == 255 || color[2] == 255;
        }
    }
    EXPECT_TRUE(saturated);
}

TEST_F(GeneticTest, HugeMutationChangeSaturatesChannels) {
    config.mutation_rate = 1.0;
    config.max_mutation_change = 1e9;
    config.candidate_colors.assign(4, cv::Vec3b(200, 200, 200));
    GeneticColorOptimizer optimizer(image, config);

    // Scores below the elite threshold: all 8 offspring are mutated
    optimizer.setScores(std::vector<double>(8, 1.0));
    optimizer.evolve();

    bool reachedMax = false;
    bool reachedMin = false;
    for (const Individual& ind : optimizer.population()) {
        for (const cv::Vec3b& color : ind.scheme) {
            for (int ch = 0; ch < 3; ++ch) {
                reachedMax = reachedMax || color[ch] == 255;
                reachedMin = reachedMin || color[ch] == 0;
            }
        }
    }
    EXPECT_TRUE(reachedMax);
    EXPECT_TRUE(reachedMin);
}

TEST_F(GeneticTest, ZeroScoresFallBackToUniformSelection) {
    GeneticColorOptimizer optimizer(image, config);
    optimizer.setScores(std::vector<double>(8, 0.0));

    EXPECT_NO_THROW(optimizer.evolve());
    EXPECT_EQ((int)optimizer.population().size(), config.population_size);
    EXPECT_DOUBLE_EQ(optimizer.history()[0].best, 0.0);
}

TEST_F(GeneticTest, BestSchemeTakesFirstOfEqualScores) {
    GeneticColorOptimizer optimizer(image, config);
    optimizer.setScores({ 3, 8, 8, 1, 0, 2, 7, 8 });

    const Individual& best = optimizer.bestScheme();

    EXPECT_DOUBLE_EQ(best.score, 8.0);
    EXPECT_EQ(&best, &optimizer.population()[1]);
}

TEST_F(GeneticTest, SameSeedSameEvolution) {
    GeneticColorOptimizer a(image, config);
    GeneticColorOptimizer b(image, config);
    std::vector<double> scores = { 1, 9, 3, 4, 8, 6, 2, 5 };

    a.setScores(scores);
    b.setScores(scores);
    a.evolve();
    b.evolve();

    for (int i = 0; i < config.population_size; ++i)
        EXPECT_TRUE(sameScheme(a.population()[i].scheme, b.population()[i].scheme));
}

TEST_F(GeneticTest, TooFewCandidateColorsIsRejected) {
    config.n_colors = 10; // The built-in pool has 9 colors

    EXPECT_THROW(GeneticColorOptimizer optimizer(image, config), std::invalid_argument);
}

TEST_F(GeneticTest, InvalidSettingsAreRejected) {
    GeneticConfig bad = config;
    bad.population_size = 0;
    EXPECT_THROW(GeneticColorOptimizer optimizer(image, bad), std::invalid_argument);

    bad = config;
    bad.mutation_rate = 1.5;
    EXPECT_THROW(GeneticColorOptimizer optimizer(image, bad), std::invalid_argument);
}

TEST_F(GeneticTest, WrongImageTypeIsRejected) {
    cv::Mat gray = cv::Mat::zeros(20, 20, CV_8UC1);

    EXPECT_THROW(GeneticColorOptimizer optimizer(gray, config), cv::Exception);
    EXPECT_THROW(GeneticColorOptimizer optimizer(cv::Mat(), config), cv::Exception);
}
