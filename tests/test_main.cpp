#include <gtest/gtest.h>

#include <QCoreApplication>
#include <spdlog/spdlog.h>

// QProcess and QSaveFile expect an application object
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(spdlog::level::warn);
    return RUN_ALL_TESTS();
}
