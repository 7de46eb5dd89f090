#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPipeline)
Q_DECLARE_LOGGING_CATEGORY(lcTree)
Q_DECLARE_LOGGING_CATEGORY(lcPdf)
