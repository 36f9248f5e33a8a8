#include <gtest/gtest.h>

#include "theme.h"
#include "tokenstore.h"

#include <QColor>
#include <QJsonArray>
#include <QJsonObject>

static QStringList tenShades(const QString &base = QStringLiteral("#10%1%1%1%1"))
{
    QStringList shades;
    for (int i = 0; i < TokenStore::ShadeCount; ++i)
        shades.append(base.arg(i));
    return shades;
}

static QJsonArray toArray(const QStringList &list)
{
    return QJsonArray::fromStringList(list);
}

// ─── Colors ─────────────────────────────────────────────────────────────────

TEST(TokenStore, RegisterColorStoresTenShades) {
    TokenStore store;
    StyleError error;
    ASSERT_TRUE(store.registerColor(QStringLiteral("brand"), tenShades(), &error));
    EXPECT_FALSE(error.isError());
    EXPECT_TRUE(store.hasColor(QStringLiteral("brand")));
    EXPECT_EQ(store.shades(QStringLiteral("brand")).size(), 10);
    EXPECT_EQ(store.color(QStringLiteral("brand"), 3), QStringLiteral("#103333"));
}

TEST(TokenStore, ColorNamesAreNormalized) {
    TokenStore store;
    QStringList shades = tenShades();
    shades[0] = QStringLiteral("#ABCDEF");
    shades[1] = QStringLiteral("red");
    ASSERT_TRUE(store.registerColor(QStringLiteral("brand"), shades));
    EXPECT_EQ(store.color(QStringLiteral("brand"), 0), QStringLiteral("#abcdef"));
    EXPECT_EQ(store.color(QStringLiteral("brand"), 1), QStringLiteral("#ff0000"));
}

TEST(TokenStore, NineShadesIsValidationError) {
    TokenStore store;
    QStringList shades = tenShades();
    shades.removeLast();
    StyleError error;
    EXPECT_FALSE(store.registerColor(QStringLiteral("brand"), shades, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
    EXPECT_FALSE(store.hasColor(QStringLiteral("brand")));
}

TEST(TokenStore, InvalidShadeIsValidationError) {
    TokenStore store;
    QStringList shades = tenShades();
    shades[4] = QStringLiteral("not-a-color");
    StyleError error;
    EXPECT_FALSE(store.registerColor(QStringLiteral("brand"), shades, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

TEST(TokenStore, ReservedOrMalformedFamilyNames) {
    TokenStore store;
    StyleError error;
    EXPECT_FALSE(store.registerColor(QStringLiteral("primary"), tenShades(), &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
    EXPECT_FALSE(store.registerColor(QStringLiteral("Brand Blue"), tenShades(), &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

TEST(TokenStore, ColorLookupErrors) {
    TokenStore store;
    ASSERT_TRUE(store.registerColor(QStringLiteral("brand"), tenShades()));

    StyleError error;
    EXPECT_TRUE(store.color(QStringLiteral("missing"), 2, &error).isEmpty());
    EXPECT_EQ(error.kind(), StyleError::Lookup);

    error = StyleError();
    EXPECT_TRUE(store.color(QStringLiteral("brand"), 10, &error).isEmpty());
    EXPECT_EQ(error.kind(), StyleError::Lookup);

    error = StyleError();
    EXPECT_TRUE(store.color(QStringLiteral("brand"), -1, &error).isEmpty());
    EXPECT_EQ(error.kind(), StyleError::Lookup);
}

// ─── Numeric tables ─────────────────────────────────────────────────────────

TEST(TokenStore, NumericTablesValidateRanges) {
    TokenStore store;
    StyleError error;

    EXPECT_TRUE(store.setNumeric(TokenStore::Spacing, QStringLiteral("md"), 16));
    EXPECT_TRUE(store.setNumeric(TokenStore::Radius, QStringLiteral("none"), 0));

    EXPECT_FALSE(store.setNumeric(TokenStore::Radius, QStringLiteral("bad"), -1, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_FALSE(store.setNumeric(TokenStore::Breakpoint, QStringLiteral("base"), 100, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_FALSE(store.setNumeric(TokenStore::Breakpoint, QStringLiteral("sm"), 0, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_FALSE(store.setNumeric(TokenStore::Breakpoint, QStringLiteral("sm"), 480.5, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_FALSE(store.setShadow(QStringLiteral("md"), QStringLiteral("  "), &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_FALSE(store.setScale(0, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

TEST(TokenStore, BreakpointsMustFitInAnInt) {
    TokenStore store;
    StyleError error;
    EXPECT_FALSE(store.setNumeric(TokenStore::Breakpoint, QStringLiteral("huge"), 1e12, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
    EXPECT_TRUE(store.breakpoints().isEmpty());

    QJsonObject breakpoints;
    breakpoints[QStringLiteral("huge")] = 3e9;
    QJsonObject partial;
    partial[QStringLiteral("breakpoints")] = breakpoints;
    EXPECT_FALSE(store.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_TRUE(store.setNumeric(TokenStore::Breakpoint, QStringLiteral("wide"), 2147483647.0));
}

TEST(TokenStore, NumericLookup) {
    TokenStore store;
    store.setNumeric(TokenStore::Spacing, QStringLiteral("md"), 16);

    EXPECT_DOUBLE_EQ(store.numeric(TokenStore::Spacing, QStringLiteral("md")), 16);

    StyleError error;
    store.numeric(TokenStore::Spacing, QStringLiteral("huge"), &error);
    EXPECT_EQ(error.kind(), StyleError::Lookup);
}

TEST(TokenStore, BreakpointsAreSortedByWidth) {
    TokenStore store;
    store.setNumeric(TokenStore::Breakpoint, QStringLiteral("xl"), 1200);
    store.setNumeric(TokenStore::Breakpoint, QStringLiteral("sm"), 576);
    store.setNumeric(TokenStore::Breakpoint, QStringLiteral("lg"), 992);

    const BreakpointTable table = store.breakpoints();
    ASSERT_EQ(table.size(), 3);
    EXPECT_EQ(table.at(0).first, QStringLiteral("sm"));
    EXPECT_EQ(table.at(1).first, QStringLiteral("lg"));
    EXPECT_EQ(table.at(2).first, QStringLiteral("xl"));
    EXPECT_EQ(table.at(2).second, 1200);
}

// ─── Merge ──────────────────────────────────────────────────────────────────

TEST(TokenStore, MergeReplacesWholeColorFamily) {
    TokenStore store;
    ASSERT_TRUE(store.registerColor(QStringLiteral("blue"), tenShades(QStringLiteral("#00%1%1ff"))));
    ASSERT_TRUE(store.registerColor(QStringLiteral("gray"), tenShades()));
    const QStringList grayBefore = store.shades(QStringLiteral("gray"));

    QJsonObject colors;
    colors[QStringLiteral("blue")] = toArray(tenShades(QStringLiteral("#%1%1%1%1%1%1")));
    QJsonObject partial;
    partial[QStringLiteral("colors")] = colors;

    ASSERT_TRUE(store.merge(partial));
    EXPECT_EQ(store.color(QStringLiteral("blue"), 2), QStringLiteral("#222222"));
    EXPECT_EQ(store.shades(QStringLiteral("gray")), grayBefore);
}

TEST(TokenStore, MergeIsAtomicOnFailure) {
    TokenStore store;
    ASSERT_TRUE(store.registerColor(QStringLiteral("blue"), tenShades()));
    store.setNumeric(TokenStore::Spacing, QStringLiteral("md"), 16);
    const TokenStore before = store;

    QStringList nine = tenShades(QStringLiteral("#%1%1%1%1%1%1"));
    nine.removeLast();
    QJsonObject colors;
    colors[QStringLiteral("blue")] = toArray(nine);
    QJsonObject spacing;
    spacing[QStringLiteral("md")] = 20;
    QJsonObject partial;
    partial[QStringLiteral("spacing")] = spacing;
    partial[QStringLiteral("colors")] = colors;

    StyleError error;
    EXPECT_FALSE(store.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
    EXPECT_TRUE(store == before);
}

TEST(TokenStore, MergeNumericTablesKeyByKey) {
    TokenStore store;
    store.setNumeric(TokenStore::Spacing, QStringLiteral("sm"), 12);
    store.setNumeric(TokenStore::Spacing, QStringLiteral("md"), 16);

    QJsonObject spacing;
    spacing[QStringLiteral("md")] = 18;
    QJsonObject partial;
    partial[QStringLiteral("spacing")] = spacing;
    partial[QStringLiteral("scale")] = 1.25;

    ASSERT_TRUE(store.merge(partial));
    EXPECT_DOUBLE_EQ(store.numeric(TokenStore::Spacing, QStringLiteral("sm")), 12);
    EXPECT_DOUBLE_EQ(store.numeric(TokenStore::Spacing, QStringLiteral("md")), 18);
    EXPECT_DOUBLE_EQ(store.scale(), 1.25);
}

TEST(TokenStore, MergeRejectsNonNumericEntries) {
    TokenStore store;
    QJsonObject radius;
    radius[QStringLiteral("md")] = QStringLiteral("6px");
    QJsonObject partial;
    partial[QStringLiteral("radius")] = radius;

    StyleError error;
    EXPECT_FALSE(store.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

// ─── Built-in defaults ──────────────────────────────────────────────────────

TEST(TokenStore, DefaultFamiliesAllHaveTenValidShades) {
    const Theme theme = Theme::defaultTheme();
    const QStringList families = theme.tokens.colorFamilies();
    EXPECT_EQ(families.size(), 14);
    for (const QString &family : families) {
        const QStringList shades = theme.tokens.shades(family);
        ASSERT_EQ(shades.size(), 10) << qPrintable(family);
        for (const QString &shade : shades)
            EXPECT_TRUE(QColor(shade).isValid()) << qPrintable(family);
    }
}

TEST(TokenStore, DefaultTables) {
    const TokenStore tokens = Theme::defaultTheme().tokens;
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::Spacing, QStringLiteral("xxs")), 4);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::Spacing, QStringLiteral("xxl")), 40);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::Radius, QStringLiteral("full")), 9999);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::FontSize, QStringLiteral("h1")), 34);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::LineHeight, QStringLiteral("md")), 1.55);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::FontWeight, QStringLiteral("black")), 900);
    EXPECT_DOUBLE_EQ(tokens.numeric(TokenStore::Breakpoint, QStringLiteral("md")), 768);
    EXPECT_TRUE(tokens.hasShadow(QStringLiteral("xl")));
    EXPECT_DOUBLE_EQ(tokens.scale(), 1.0);
    EXPECT_TRUE(tokens.validate());
}
