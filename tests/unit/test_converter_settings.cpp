// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QTemporaryDir>

#include <KConfigGroup>
#include <KSharedConfig>

#include "config/convertersettings.h"

using namespace Zoned;

/**
 * @brief Unit tests for ConverterSettings
 *
 * Each test works on its own zonedrc inside a temporary directory.
 */
class TestConverterSettings : public QObject
{
    Q_OBJECT

private:
    KSharedConfig::Ptr openConfig() const
    {
        return KSharedConfig::openConfig(m_tempDir->filePath(QStringLiteral("zonedrc")), KConfig::SimpleConfig);
    }

    QTemporaryDir* m_tempDir = nullptr;

private Q_SLOTS:

    void init()
    {
        m_tempDir = new QTemporaryDir();
        QVERIFY(m_tempDir->isValid());
    }

    void cleanup()
    {
        delete m_tempDir;
        m_tempDir = nullptr;
    }

    void test_defaults_whenFileMissing()
    {
        ConverterSettings settings(openConfig());
        settings.load();

        QCOMPARE(settings.indentedJson(), true);
        QCOMPARE(settings.strictValidation(), true);
        QCOMPARE(settings.rejectPartialResults(), false);
        QCOMPARE(settings.defaultTemplate(), QStringLiteral("split"));
    }

    void test_load_readsConverterGroup()
    {
        {
            KSharedConfig::Ptr config = openConfig();
            KConfigGroup group = config->group(QStringLiteral("Converter"));
            group.writeEntry("IndentedJson", false);
            group.writeEntry("RejectPartialResults", true);
            group.writeEntry("DefaultTemplate", QStringLiteral("quarters"));
            QVERIFY(config->sync());
        }

        ConverterSettings settings(openConfig());
        settings.load();

        QCOMPARE(settings.indentedJson(), false);
        QCOMPARE(settings.strictValidation(), true);
        QCOMPARE(settings.rejectPartialResults(), true);
        QCOMPARE(settings.defaultTemplate(), QStringLiteral("quarters"));
    }

    void test_load_unknownTemplateFallsBack()
    {
        {
            KSharedConfig::Ptr config = openConfig();
            config->group(QStringLiteral("Converter")).writeEntry("DefaultTemplate", QStringLiteral("bogus"));
            QVERIFY(config->sync());
        }

        ConverterSettings settings(openConfig());
        settings.load();

        QCOMPARE(settings.defaultTemplate(), QStringLiteral("split"));
    }

    void test_save_thenLoad()
    {
        {
            ConverterSettings settings(openConfig());
            settings.setIndentedJson(false);
            settings.setStrictValidation(false);
            settings.setRejectPartialResults(true);
            settings.setDefaultTemplate(QStringLiteral("triple_stack"));
            settings.save();
        }

        ConverterSettings reloaded(openConfig());
        reloaded.load();

        QCOMPARE(reloaded.indentedJson(), false);
        QCOMPARE(reloaded.strictValidation(), false);
        QCOMPARE(reloaded.rejectPartialResults(), true);
        QCOMPARE(reloaded.defaultTemplate(), QStringLiteral("triple_stack"));
    }

    void test_setDefaultTemplate_ignoresUnknownId()
    {
        ConverterSettings settings(openConfig());
        settings.setDefaultTemplate(QStringLiteral("wide"));
        settings.setDefaultTemplate(QStringLiteral("unknown"));

        QCOMPARE(settings.defaultTemplate(), QStringLiteral("wide"));
    }

    void test_reset_restoresDefaults()
    {
        ConverterSettings settings(openConfig());
        settings.setIndentedJson(false);
        settings.setRejectPartialResults(true);
        settings.setDefaultTemplate(QStringLiteral("wide"));

        settings.reset();

        QCOMPARE(settings.indentedJson(), true);
        QCOMPARE(settings.rejectPartialResults(), false);
        QCOMPARE(settings.defaultTemplate(), QStringLiteral("split"));
    }
};

QTEST_MAIN(TestConverterSettings)
#include "test_converter_settings.moc"
