#pragma once
#include "core.h"

namespace gsx {

struct SignatureParseResult {
    bool          ok;
    TypeSignature signature;
    QString       error;
    int           errorPos;
};

struct SignatureListResult {
    bool                   ok;
    QVector<TypeSignature> signatures;
    QString                error;
    int                    errorPos;
};

class SignatureParser {
public:
    static constexpr int kMaxDepth = 128;

    // Exactly one complete type, consuming the whole string
    static SignatureParseResult parse(const QString& text);
    // Zero or more complete types back to back (the payload of a 'g' value)
    static SignatureListResult parseList(const QString& text);
    static QString validate(const QString& text);
};

} // namespace gsx
