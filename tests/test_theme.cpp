#include <gtest/gtest.h>

#include "theme.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

class ThemeTest : public ::testing::Test {
protected:
    void SetUp() override {
        theme_ = Theme::defaultTheme();
        ASSERT_TRUE(theme_.validate());
    }

    Theme theme_;
};

// ─── Defaults ───────────────────────────────────────────────────────────────

TEST_F(ThemeTest, DefaultsFromResource) {
    EXPECT_EQ(theme_.colorScheme, ColorScheme::Light);
    EXPECT_EQ(theme_.primaryColor, QStringLiteral("blue"));
    EXPECT_EQ(theme_.primaryShadeLight, 6);
    EXPECT_EQ(theme_.primaryShadeDark, 8);
    EXPECT_TRUE(theme_.components.contains(QStringLiteral("QPushButton")));
}

TEST_F(ThemeTest, PrimaryShadeFollowsScheme) {
    EXPECT_EQ(theme_.primaryShade(), 6);
    theme_.colorScheme = ColorScheme::Dark;
    EXPECT_EQ(theme_.primaryShade(), 8);
}

TEST_F(ThemeTest, SemanticColorsDependOnScheme) {
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("body")), QStringLiteral("#ffffff"));
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("dimmed")),
              theme_.tokens.color(QStringLiteral("gray"), 6));
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("primary")),
              theme_.tokens.color(QStringLiteral("blue"), 6));
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("anchor")),
              theme_.tokens.color(QStringLiteral("blue"), 6));

    theme_.colorScheme = ColorScheme::Dark;
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("body")),
              theme_.tokens.color(QStringLiteral("dark"), 7));
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("primary")),
              theme_.tokens.color(QStringLiteral("blue"), 8));
    EXPECT_EQ(theme_.semanticColor(QStringLiteral("anchor")),
              theme_.tokens.color(QStringLiteral("blue"), 4));
}

TEST_F(ThemeTest, UnknownAliasIsLookupError) {
    StyleError error;
    EXPECT_TRUE(theme_.semanticColor(QStringLiteral("sparkly"), &error).isEmpty());
    EXPECT_EQ(error.kind(), StyleError::Lookup);
}

// ─── Merging ────────────────────────────────────────────────────────────────

TEST_F(ThemeTest, MergeSchemeAndPrimary) {
    QJsonObject partial;
    partial[QStringLiteral("colorScheme")] = QStringLiteral("dark");
    partial[QStringLiteral("primaryColor")] = QStringLiteral("teal");
    partial[QStringLiteral("primaryShade")] = 5;

    ASSERT_TRUE(theme_.merge(partial));
    EXPECT_EQ(theme_.colorScheme, ColorScheme::Dark);
    EXPECT_EQ(theme_.primaryColor, QStringLiteral("teal"));
    EXPECT_EQ(theme_.primaryShadeLight, 5);
    EXPECT_EQ(theme_.primaryShadeDark, 5);
}

TEST_F(ThemeTest, UnknownPrimaryColorIsRejected) {
    const Theme before = theme_;
    QJsonObject partial;
    partial[QStringLiteral("primaryColor")] = QStringLiteral("chartreuse");

    StyleError error;
    EXPECT_FALSE(theme_.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Lookup);
    EXPECT_TRUE(theme_ == before);
}

TEST_F(ThemeTest, UnknownSchemeIsValidationError) {
    QJsonObject partial;
    partial[QStringLiteral("colorScheme")] = QStringLiteral("sepia");
    StyleError error;
    EXPECT_FALSE(theme_.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

TEST_F(ThemeTest, PrimaryShadeOutOfRange) {
    QJsonObject shades;
    shades[QStringLiteral("dark")] = 12;
    QJsonObject partial;
    partial[QStringLiteral("primaryShade")] = shades;
    StyleError error;
    EXPECT_FALSE(theme_.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);
}

TEST_F(ThemeTest, ComponentOverridesMergePerProp) {
    QJsonObject button;
    button[QStringLiteral("bdrs")] = QStringLiteral("xl");
    QJsonObject components;
    components[QStringLiteral("QPushButton")] = button;
    QJsonObject partial;
    partial[QStringLiteral("components")] = components;

    ASSERT_TRUE(theme_.merge(partial));
    const PropBag bag = theme_.components.value(QStringLiteral("QPushButton"));
    EXPECT_EQ(bag.value(QStringLiteral("bdrs")), StyleValue(QStringLiteral("xl")));
    // Untouched props of the same component survive
    EXPECT_EQ(bag.value(QStringLiteral("bg")), StyleValue(QStringLiteral("primary")));
}

TEST_F(ThemeTest, MalformedComponentOverridesAreRejected) {
    const Theme before = theme_;
    QJsonObject components;
    components[QStringLiteral("QPushButton")] = QStringLiteral("oops");
    QJsonObject partial;
    partial[QStringLiteral("components")] = components;

    StyleError error;
    EXPECT_FALSE(theme_.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    QJsonObject badProp;
    badProp[QStringLiteral("m")] = true;
    components[QStringLiteral("QPushButton")] = badProp;
    partial[QStringLiteral("components")] = components;
    error = StyleError();
    EXPECT_FALSE(theme_.merge(partial, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    QJsonObject font;
    font[QStringLiteral("fontFamily")] = QJsonArray();
    error = StyleError();
    EXPECT_FALSE(theme_.merge(font, &error));
    EXPECT_EQ(error.kind(), StyleError::Validation);

    EXPECT_TRUE(theme_ == before);
}

// ─── Variants ───────────────────────────────────────────────────────────────

TEST_F(ThemeTest, DefaultVariants) {
    const auto button = theme_.variants.variantNames(QStringLiteral("QPushButton"));
    EXPECT_EQ(button.value(VariantType::Color).size(), 5);
    EXPECT_TRUE(button.value(VariantType::Style).contains(QStringLiteral("outline")));
    EXPECT_EQ(button.value(VariantType::Size).size(), 5);

    const PropBag filled = theme_.variants.variant(QStringLiteral("QLineEdit"), VariantType::Style,
                                                   QStringLiteral("filled"));
    EXPECT_EQ(filled.value(QStringLiteral("bg")), StyleValue(QStringLiteral("gray.0")));
    EXPECT_FALSE(theme_.variants.contains(QStringLiteral("QLineEdit"), VariantType::Color,
                                          QStringLiteral("primary")));
}

TEST_F(ThemeTest, MergedVariantReplacesNamedVariantWhole) {
    const QJsonObject partial = QJsonDocument::fromJson(QByteArray(R"({
        "variants": { "QPushButton": { "style": { "outline": { "bd": "2px dashed" } } } }
    })")).object();

    ASSERT_TRUE(theme_.merge(partial));
    const PropBag outline = theme_.variants.variant(QStringLiteral("QPushButton"),
                                                    VariantType::Style, QStringLiteral("outline"));
    EXPECT_EQ(outline.entries().size(), 1);
    EXPECT_TRUE(theme_.variants.contains(QStringLiteral("QPushButton"), VariantType::Style,
                                         QStringLiteral("light")));
}

TEST_F(ThemeTest, VariantTypeNames) {
    VariantType type = VariantType::Color;
    EXPECT_TRUE(ComponentVariants::typeFromName(QStringLiteral("size"), &type));
    EXPECT_EQ(type, VariantType::Size);
    EXPECT_FALSE(ComponentVariants::typeFromName(QStringLiteral("shape"), &type));
    EXPECT_EQ(ComponentVariants::typeName(VariantType::State), QStringLiteral("state"));
}

// ─── Serialization ──────────────────────────────────────────────────────────

TEST_F(ThemeTest, JsonRoundTripPreservesTheme) {
    StyleError error;
    const Theme copy = Theme::fromJson(theme_.toJson(), &error);
    EXPECT_FALSE(error.isError()) << qPrintable(error.toString());
    EXPECT_TRUE(copy == theme_);
}

TEST_F(ThemeTest, MissingAliasFamilyFailsValidation) {
    // Aliases reference gray/dark/red; a theme without them is incomplete
    Theme bare;
    QStringList shades;
    for (int i = 0; i < 10; ++i)
        shades.append(QStringLiteral("#0000%1%1").arg(i));
    ASSERT_TRUE(bare.tokens.registerColor(QStringLiteral("blue"), shades));

    StyleError error;
    EXPECT_FALSE(bare.validate(&error));
    EXPECT_EQ(error.kind(), StyleError::Lookup);
}

TEST(ThemeScheme, Names) {
    ColorScheme scheme = ColorScheme::Light;
    EXPECT_TRUE(Theme::schemeFromName(QStringLiteral("Dark"), &scheme));
    EXPECT_EQ(scheme, ColorScheme::Dark);
    EXPECT_FALSE(Theme::schemeFromName(QStringLiteral("auto"), &scheme));
    EXPECT_EQ(scheme, ColorScheme::Dark);
    EXPECT_EQ(Theme::schemeName(ColorScheme::Light), QStringLiteral("light"));
}
