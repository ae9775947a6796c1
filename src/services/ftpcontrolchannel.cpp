#include "ftpcontrolchannel.h"
#include "ftpdatachannel.h"
#include "ftplistingparser.h"

#include <QBuffer>
#include <QPointer>
#include <QSslCipher>
#include <QSslSocket>
#include <QTimer>

#include "utils/logging.h"

struct FtpControlChannel::ListingContext {
    QString path;
    ListingCallback done;
    QPointer<FtpDataChannel> data;
    std::shared_ptr<QBuffer> buffer;
    bool dataFinished = false;
    bool replyFinished = false;
    bool completed = false;
};

FtpControlChannel::FtpControlChannel(QObject *parent)
    : QObject(parent)
    , socket_(new QSslSocket(this))
    , replyTimer_(new QTimer(this))
    , abortTimer_(new QTimer(this))
{
    replyTimer_->setSingleShot(true);
    connect(replyTimer_, &QTimer::timeout, this, &FtpControlChannel::onReplyTimeout);
    abortTimer_->setSingleShot(true);
    connect(abortTimer_, &QTimer::timeout, this, &FtpControlChannel::onAbortTimeout);

    connect(socket_, &QSslSocket::connected, this, [this]() {
        qDebug() << "FTP: Control socket connected to" << socket_->peerAddress().toString();
    });
    connect(socket_, &QSslSocket::readyRead, this, &FtpControlChannel::onSocketReadyRead);
    connect(socket_, &QSslSocket::disconnected, this, &FtpControlChannel::onSocketDisconnected);
    connect(socket_, &QSslSocket::errorOccurred, this, &FtpControlChannel::onSocketError);
    connect(socket_, &QSslSocket::encrypted, this, &FtpControlChannel::onEncrypted);
}

FtpControlChannel::~FtpControlChannel()
{
    // Owners are being torn down as well; don't call back into them
    socket_->disconnect(this);
    operations_.clear();
    activeOperation_.reset();
    socket_->abort();
}

QHostAddress FtpControlChannel::peerAddress() const
{
    return socket_->peerAddress();
}

QHostAddress FtpControlChannel::localAddress() const
{
    return socket_->localAddress();
}

void FtpControlChannel::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

// Session setup

void FtpControlChannel::connectToHost(const QString &host, quint16 port, int timeoutMs, Completion done)
{
    if (state_ != State::Unconnected) {
        qDebug() << "FTP: connectToHost called but state is" << static_cast<int>(state_);
        done(FtpError::connectError(tr("Connection already in progress or established")));
        return;
    }

    host_ = host;
    setState(State::Connecting);

    enqueue({[this, host, port, timeoutMs, done]() {
        qDebug() << "FTP: Connecting to" << host << ":" << port;

        // The greeting is the reply to the connection itself
        commandOutstanding_ = true;
        replyHandler_ = [this, done](const FtpReply &reply) {
            if (reply.code != FtpReplyServiceReady) {
                FtpError error = FtpError::connectError(tr("Unexpected server greeting"));
                error.replyCode = reply.code;
                error.serverMessage = reply.message();
                invalidate(error);
                return;
            }
            greeting_ = reply.message();
            LOG_VERBOSE() << "FTP: Server greeting:" << greeting_;
            setState(State::LoggingIn);
            completeOperation();
            done(FtpError::none());
        };
        replyTimer_->start(timeoutMs);
        socket_->connectToHost(host, port);
    }, done});
}

void FtpControlChannel::negotiateTls(Completion done)
{
    enqueue({[this, done]() {
        if (!QSslSocket::supportsSsl()) {
            invalidate(FtpError::tlsError(tr("TLS is not available on this system")));
            return;
        }

        sendCommand("AUTH TLS", [this, done](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (reply.code != FtpReplyAuthOk) {
                invalidate(FtpError::tlsError(tr("Server refused AUTH TLS"),
                                              reply.code, reply.message()));
                return;
            }

            if (!options_.verifyPeerCertificates) {
                socket_->setPeerVerifyMode(QSslSocket::VerifyNone);
            }
            socket_->setPeerVerifyName(host_);
            tlsDone_ = done;
            replyTimer_->start(options_.connectTimeoutMs);
            socket_->startClientEncryption();
        });
    }, done});
}

void FtpControlChannel::onEncrypted()
{
    if (!tlsDone_) {
        return;
    }
    replyTimer_->stop();
    qDebug() << "FTP: Control connection encrypted with" << socket_->sessionCipher().name();

    Completion done = std::move(tlsDone_);
    tlsDone_ = nullptr;
    completeOperation();
    done(FtpError::none());
}

void FtpControlChannel::authenticate(const FtpCredentials &credentials, Completion done)
{
    enqueue({[this, credentials, done]() {
        if (state_ == State::Connecting) {
            setState(State::LoggingIn);
        }

        sendCommand("USER " + credentials.username, [this, credentials, done](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (reply.code == FtpReplyUserLoggedIn) {
                // Logged in without password
                finishLogin(done);
                return;
            }
            if (reply.code != FtpReplyPasswordRequired) {
                invalidate(FtpError::authError(reply.code, reply.message()));
                return;
            }

            sendCommand("PASS " + credentials.password, [this, done](const FtpReply &reply) {
                if (reply.isPreliminary()) {
                    return;
                }
                if (reply.code == FtpReplyUserLoggedIn || reply.code == FtpReplyCommandSuperfluous) {
                    finishLogin(done);
                } else {
                    invalidate(FtpError::authError(reply.code, reply.message()));
                }
            });
        });
    }, done});
}

void FtpControlChannel::finishLogin(const Completion &done)
{
    qDebug() << "FTP: Logged in to" << host_;
    setState(State::Ready);
    completeOperation();
    done(FtpError::none());
}

void FtpControlChannel::upgradeToSecure(Completion done)
{
    enqueue({[this, done]() {
        sendCommand("PBSZ 0", [this, done](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (!reply.isPositiveCompletion()) {
                invalidate(FtpError::tlsError(tr("Server refused PBSZ"), reply.code, reply.message()));
                return;
            }

            sendCommand("PROT P", [this, done](const FtpReply &reply) {
                if (reply.isPreliminary()) {
                    return;
                }
                if (!reply.isPositiveCompletion()) {
                    invalidate(FtpError::tlsError(tr("Server refused PROT P"),
                                                  reply.code, reply.message()));
                    return;
                }
                protected_ = true;
                completeOperation();
                done(FtpError::none());
            });
        });
    }, done});
}

void FtpControlChannel::open(const ConnectionProfile &profile, const SessionOptions &options,
                             Completion done)
{
    options_ = options;
    options_.normalize();
    passive_ = profile.passive;

    const bool tls = profile.tls;
    const FtpCredentials credentials = profile.credentials();

    connectToHost(profile.host, profile.port, options_.connectTimeoutMs,
                  [this, tls, credentials, done](const FtpError &error) {
        if (error.isError()) {
            done(error);
            return;
        }

        auto login = [this, tls, credentials, done]() {
            authenticate(credentials, [this, tls, done](const FtpError &error) {
                if (error.isError()) {
                    done(error);
                    return;
                }

                // A failing PWD leaves the default directory; the session is still usable
                auto finish = [this, done]() {
                    printWorkingDirectory([done](const QString &, const FtpError &error) {
                        if (error.isError() && error.reconnectRequired()) {
                            done(error);
                        } else {
                            done(FtpError::none());
                        }
                    });
                };

                if (!tls) {
                    finish();
                    return;
                }
                upgradeToSecure([finish, done](const FtpError &error) {
                    if (error.isError()) {
                        done(error);
                        return;
                    }
                    finish();
                });
            });
        };

        if (!tls) {
            login();
            return;
        }
        negotiateTls([login, done](const FtpError &error) {
            if (error.isError()) {
                done(error);
                return;
            }
            login();
        });
    });
}

void FtpControlChannel::quit()
{
    if (state_ == State::Unconnected) {
        setState(State::Disconnected);
        return;
    }
    if (state_ == State::Disconnected) {
        return;
    }

    enqueue({[this]() {
        quitting_ = true;
        sendCommand("QUIT", [this](const FtpReply &reply) {
            if (!reply.isPreliminary()) {
                socket_->disconnectFromHost();
            }
        });
    }, [](const FtpError &) {}});
}

void FtpControlChannel::abortConnection(const FtpError &error)
{
    qDebug() << "FTP: Dropping control connection";
    invalidate(error);
}

// Operation queue

void FtpControlChannel::enqueue(FtpOperation operation)
{
    if (state_ == State::Disconnected) {
        if (operation.abort) {
            operation.abort(FtpError::connectError(tr("Not connected to server")));
        }
        return;
    }

    operations_.enqueue(std::move(operation));
    startNextOperation();
}

void FtpControlChannel::startNextOperation()
{
    if (activeOperation_ || operations_.isEmpty() || state_ == State::Disconnected) {
        return;
    }

    activeOperation_ = operations_.dequeue();
    // Copy: start() may complete the operation and destroy the stored function
    const auto start = activeOperation_->start;
    if (start) {
        start();
    } else {
        completeOperation();
    }
}

void FtpControlChannel::completeOperation()
{
    if (!activeOperation_) {
        return;
    }
    activeOperation_.reset();
    startNextOperation();
}

void FtpControlChannel::sendCommand(const QString &command, ReplyHandler handler)
{
    if (state_ == State::Disconnected) {
        qDebug() << "FTP: Cannot send command, channel is closed";
        return;
    }

    replyHandler_ = std::move(handler);
    commandOutstanding_ = true;
    writeCommand(command);
    replyTimer_->start(options_.replyTimeoutMs);
}

void FtpControlChannel::writeCommand(const QString &command)
{
    // Don't log password
    if (command.startsWith("PASS ")) {
        qDebug() << "FTP: >>" << "PASS ****";
    } else {
        qDebug() << "FTP: >>" << command;
    }
    socket_->write((command + "\r\n").toUtf8());
}

void FtpControlChannel::execute(const QString &command, ReplyHandler handler, Completion aborted)
{
    enqueue({[this, command, handler]() {
        sendCommand(command, [this, handler](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            completeOperation();
            handler(reply);
        });
    }, aborted});
}

void FtpControlChannel::abortCommand(Completion done)
{
    if (state_ == State::Disconnected) {
        return;
    }

    abortRepliesPending_ = commandOutstanding_ ? 2 : 1;
    replyHandler_ = nullptr;
    abortDone_ = std::move(done);
    replyTimer_->stop();

    qDebug() << "FTP: Aborting, expecting" << abortRepliesPending_ << "replies";
    writeCommand("ABOR");
    abortTimer_->start(options_.abortTimeoutMs);
}

void FtpControlChannel::restartReplyTimer()
{
    if (commandOutstanding_ && state_ != State::Disconnected) {
        replyTimer_->start(options_.replyTimeoutMs);
    }
}

// Socket events

void FtpControlChannel::onSocketReadyRead()
{
    parser_.feed(socket_->readAll());

    while (parser_.hasReply() && state_ != State::Disconnected) {
        dispatchReply(parser_.takeReply());
    }

    if (parser_.hasError() && state_ != State::Disconnected) {
        invalidate(FtpError::protocolError(parser_.errorString()));
    }
}

void FtpControlChannel::dispatchReply(const FtpReply &reply)
{
    qDebug() << "FTP: <<" << reply.code << reply.text();
    if (reply.lines.size() > 1) {
        LOG_VERBOSE() << "FTP: <<" << reply.message();
    }

    if (abortRepliesPending_ > 0) {
        if (reply.isPreliminary()) {
            return;
        }
        if (--abortRepliesPending_ == 0) {
            abortTimer_->stop();
            commandOutstanding_ = false;
            Completion done = std::move(abortDone_);
            abortDone_ = nullptr;
            if (done) {
                done(FtpError::none());
            }
        }
        return;
    }

    if (reply.code == 421) {
        FtpError error = FtpError::connectError(tr("Server closed the session"));
        error.replyCode = reply.code;
        error.serverMessage = reply.message();
        invalidate(error);
        return;
    }

    if (!commandOutstanding_) {
        qDebug() << "FTP: Ignoring unsolicited reply" << reply.code;
        return;
    }

    if (reply.isPreliminary()) {
        // Transfer in progress; the data connection has its own error handling
        replyTimer_->stop();
        if (replyHandler_) {
            replyHandler_(reply);
        }
        return;
    }

    replyTimer_->stop();
    commandOutstanding_ = false;
    ReplyHandler handler = std::move(replyHandler_);
    replyHandler_ = nullptr;
    if (handler) {
        handler(reply);
    }
}

void FtpControlChannel::onSocketDisconnected()
{
    qDebug() << "FTP: Control socket disconnected";
    if (state_ == State::Disconnected) {
        return;
    }
    invalidate(FtpError::connectError(tr("Connection closed by server")));
}

void FtpControlChannel::onSocketError()
{
    if (state_ == State::Disconnected) {
        return;
    }

    const QAbstractSocket::SocketError socketError = socket_->error();
    qDebug() << "FTP: Control socket error:" << socketError << socket_->errorString();

    if (socketError == QAbstractSocket::RemoteHostClosedError && quitting_) {
        return;
    }
    if (tlsDone_ || socketError == QAbstractSocket::SslHandshakeFailedError) {
        invalidate(FtpError::tlsError(socket_->errorString()));
    } else {
        invalidate(FtpError::connectError(socket_->errorString()));
    }
}

void FtpControlChannel::onReplyTimeout()
{
    qDebug() << "FTP: Reply timeout in state" << static_cast<int>(state_);

    if (state_ == State::Connecting) {
        invalidate(FtpError::connectError(tr("Connection timed out after %1 ms")
                                              .arg(options_.connectTimeoutMs)));
    } else if (tlsDone_) {
        invalidate(FtpError::tlsError(tr("TLS handshake timed out")));
    } else {
        invalidate(FtpError::connectError(tr("No reply from server within %1 ms")
                                              .arg(options_.replyTimeoutMs)));
    }
}

void FtpControlChannel::onAbortTimeout()
{
    invalidate(FtpError::connectError(tr("Server did not acknowledge ABOR within %1 ms")
                                          .arg(options_.abortTimeoutMs)));
}

void FtpControlChannel::invalidate(const FtpError &error)
{
    if (state_ == State::Disconnected) {
        return;
    }

    const bool established = state_ == State::Ready;
    const bool quitting = quitting_;
    if (quitting) {
        qDebug() << "FTP: Session closed";
    } else {
        qWarning() << "FTP: Control channel invalidated:" << error.toString();
    }

    replyTimer_->stop();
    abortTimer_->stop();
    replyHandler_ = nullptr;
    commandOutstanding_ = false;
    tlsDone_ = nullptr;
    abortDone_ = nullptr;
    abortRepliesPending_ = 0;

    setState(State::Disconnected);
    socket_->abort();
    parser_.reset();

    std::optional<FtpOperation> active = std::move(activeOperation_);
    activeOperation_.reset();
    QQueue<FtpOperation> queued;
    queued.swap(operations_);

    if (active && active->abort) {
        active->abort(error);
    }
    for (const FtpOperation &operation : queued) {
        if (operation.abort) {
            operation.abort(error);
        }
    }

    if (quitting) {
        emit closed();
    } else if (established) {
        emit failed(error);
    }
}

// Directory operations

QString FtpControlChannel::parsePwdReply(const QString &text)
{
    // 257 "/path ""quoted"" name" is current directory
    const int start = text.indexOf('"');
    if (start < 0) {
        return QString();
    }

    QString path;
    for (int i = start + 1; i < text.length(); ++i) {
        if (text[i] != '"') {
            path.append(text[i]);
        } else if (i + 1 < text.length() && text[i + 1] == '"') {
            path.append('"');
            ++i;
        } else {
            return path;
        }
    }
    return QString();  // Unterminated
}

void FtpControlChannel::queryWorkingDirectory(PathCallback done)
{
    sendCommand("PWD", [this, done](const FtpReply &reply) {
        if (reply.isPreliminary()) {
            return;
        }

        const QString dir = reply.isPositiveCompletion() ? parsePwdReply(reply.text()) : QString();
        if (dir.isEmpty()) {
            done(QString(), FtpError::remoteOpError("PWD", reply.code, reply.message()));
            return;
        }
        currentDir_ = dir;
        done(dir, FtpError::none());
    });
}

void FtpControlChannel::sendPwd(const PathCallback &done)
{
    queryWorkingDirectory([this, done](const QString &dir, const FtpError &error) {
        completeOperation();
        done(dir, error);
    });
}

void FtpControlChannel::printWorkingDirectory(PathCallback done)
{
    enqueue({[this, done]() { sendPwd(done); },
             [done](const FtpError &error) { done(QString(), error); }});
}

void FtpControlChannel::changeDirectory(const QString &path, PathCallback done)
{
    enqueue({[this, path, done]() {
        sendCommand("CWD " + path, [this, path, done](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (!reply.isPositiveCompletion()) {
                completeOperation();
                done(QString(), FtpError::remoteOpError("CWD", reply.code, reply.message(), path));
                return;
            }
            // The server decides where CWD took us
            sendPwd(done);
        });
    }, [done](const FtpError &error) { done(QString(), error); }});
}

void FtpControlChannel::runSimpleCommand(const QString &verb, const QString &path, Completion done)
{
    execute(verb + " " + path, [verb, path, done](const FtpReply &reply) {
        if (reply.isPositiveCompletion()) {
            done(FtpError::none());
        } else {
            done(FtpError::remoteOpError(verb, reply.code, reply.message(), path));
        }
    }, done);
}

void FtpControlChannel::makeDirectory(const QString &path, Completion done)
{
    runSimpleCommand("MKD", path, std::move(done));
}

void FtpControlChannel::removeDirectory(const QString &path, Completion done)
{
    runSimpleCommand("RMD", path, std::move(done));
}

void FtpControlChannel::deleteFile(const QString &path, Completion done)
{
    runSimpleCommand("DELE", path, std::move(done));
}

void FtpControlChannel::rename(const QString &oldPath, const QString &newPath, Completion done)
{
    enqueue({[this, oldPath, newPath, done]() {
        sendCommand("RNFR " + oldPath, [this, oldPath, newPath, done](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (reply.code != FtpReplyPendingFurtherInfo) {
                completeOperation();
                done(FtpError::remoteOpError("RNFR", reply.code, reply.message(), oldPath));
                return;
            }

            sendCommand("RNTO " + newPath, [this, newPath, done](const FtpReply &reply) {
                if (reply.isPreliminary()) {
                    return;
                }
                completeOperation();
                if (reply.isPositiveCompletion()) {
                    done(FtpError::none());
                } else {
                    done(FtpError::remoteOpError("RNTO", reply.code, reply.message(), newPath));
                }
            });
        });
    }, done});
}

void FtpControlChannel::sizeOf(const QString &path, SizeCallback done)
{
    execute("SIZE " + path, [path, done](const FtpReply &reply) {
        if (!reply.isPositiveCompletion()) {
            done(-1, FtpError::remoteOpError("SIZE", reply.code, reply.message(), path));
            return;
        }
        bool ok = false;
        const qint64 size = reply.text().trimmed().toLongLong(&ok);
        if (!ok || size < 0) {
            done(-1, FtpError::remoteOpError("SIZE", reply.code, tr("Malformed size reply"), path));
            return;
        }
        done(size, FtpError::none());
    }, [done](const FtpError &error) { done(-1, error); });
}

// Listing

void FtpControlChannel::listDirectory(const QString &path, ListingCallback done)
{
    auto context = std::make_shared<ListingContext>();
    context->path = path;
    context->done = std::move(done);

    enqueue({[this, context]() {
        sendCommand("TYPE A", [this, context](const FtpReply &reply) {
            if (reply.isPreliminary()) {
                return;
            }
            if (!reply.isPositiveCompletion()) {
                context->completed = true;
                completeOperation();
                context->done({}, FtpError::remoteOpError("TYPE", reply.code, reply.message()));
                return;
            }
            runListing(context, mlsdSupported_ ? ListingFormat::Machine : ListingFormat::Unix);
        });
    }, [context](const FtpError &error) {
        if (context->completed) {
            return;
        }
        context->completed = true;
        if (context->data) {
            context->data->close();
            context->data->deleteLater();
        }
        context->done({}, error);
    }});
}

void FtpControlChannel::runListing(const std::shared_ptr<ListingContext> &context, ListingFormat format)
{
    const QString verb = format == ListingFormat::Machine ? QStringLiteral("MLSD") : QStringLiteral("LIST");
    const QString command = context->path.isEmpty() ? verb : verb + " " + context->path;

    context->dataFinished = false;
    context->replyFinished = false;
    context->buffer = std::make_shared<QBuffer>();
    context->buffer->open(QIODevice::ReadWrite);

    auto *data = new FtpDataChannel(this, passive_ ? FtpDataChannel::Mode::Passive
                                                   : FtpDataChannel::Mode::Active,
                                    protected_, this);
    context->data = data;

    auto tryComplete = [this, context, format]() {
        if (context->dataFinished && context->replyFinished) {
            finishListing(context, format, FtpError::none());
        }
    };

    connect(data, &FtpDataChannel::finished, this, [this, context, tryComplete](qint64 total) {
        LOG_VERBOSE() << "FTP: Listing data complete," << total << "bytes";
        context->dataFinished = true;
        restartReplyTimer();
        tryComplete();
    });
    connect(data, &FtpDataChannel::failed, this, [this, context, format](const FtpError &error) {
        finishListing(context, format, error);
    });

    data->open([this, context, format, command, verb, tryComplete](const FtpError &error) {
        if (context->completed) {
            return;
        }
        if (error.isError()) {
            finishListing(context, format, error);
            return;
        }

        context->data->receiveStream(context->buffer.get(), options_.chunkSize);
        sendCommand(command, [this, context, format, verb, tryComplete](const FtpReply &reply) {
            if (reply.isPreliminary() || context->completed) {
                return;
            }
            if (!reply.isPositiveCompletion()) {
                if (format == ListingFormat::Machine &&
                    (reply.code == FtpReplySyntaxError || reply.code == FtpReplyNotImplemented)) {
                    qDebug() << "FTP: Server does not support MLSD, using LIST from now on";
                    mlsdSupported_ = false;
                }
                finishListing(context, format,
                              FtpError::remoteOpError(verb, reply.code, reply.message(), context->path));
                return;
            }
            context->replyFinished = true;
            tryComplete();
        });
    });
}

void FtpControlChannel::finishListing(const std::shared_ptr<ListingContext> &context,
                                      ListingFormat format, const FtpError &error)
{
    if (context->completed || state_ == State::Disconnected) {
        return;
    }

    if (context->data) {
        context->data->close();
        context->data->deleteLater();
        context->data = nullptr;
    }

    FtpError result = error;
    QList<RemoteEntry> entries;
    if (!result.isError()) {
        const QByteArray body = context->buffer->data();
        const bool parsed = format == ListingFormat::Machine
            ? FtpListingParser::parseMachineListing(body, entries)
            : FtpListingParser::parseUnixListing(body, entries);
        if (!parsed) {
            result = FtpError::parseError(tr("No line of the %1 reply could be parsed")
                                              .arg(format == ListingFormat::Machine ? "MLSD" : "LIST"));
            result.path = context->path;
        }
    }

    auto proceed = [this, context, format, result, entries]() {
        if (context->completed) {
            return;
        }
        if (result.isError() && format == ListingFormat::Machine) {
            qDebug() << "FTP: MLSD failed (" << result.toString() << "), falling back to LIST";
            runListing(context, ListingFormat::Unix);
            return;
        }
        context->completed = true;
        completeOperation();
        context->done(entries, result);
    };

    // The listing command may still await its final reply
    if (commandOutstanding_) {
        abortCommand([proceed](const FtpError &) { proceed(); });
    } else {
        proceed();
    }
}
