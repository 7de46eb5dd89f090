#include "ClauseLogging.hpp"

Q_LOGGING_CATEGORY(lcPipeline, "clausetree.pipeline")
Q_LOGGING_CATEGORY(lcTree, "clausetree.tree")
Q_LOGGING_CATEGORY(lcPdf, "clausetree.pdf")
