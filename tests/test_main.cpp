#include <QCoreApplication>

#include "gtest/gtest.h"

// QTimer and QNetworkAccessManager need a QCoreApplication on the test thread.
int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    QCoreApplication app(argc, argv);
    return RUN_ALL_TESTS();
}
