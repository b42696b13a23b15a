#include <algorithm>
#include <cctype>
#include <hyper-cri/core/error.hpp>
#include <hyper-cri/core/logger.hpp>
#include <hyper-cri/sandbox/label_annotation_splitter.hpp>
#include <hyper-cri/sandbox/sandbox_filter.hpp>
#include <hyper-cri/sandbox/sandbox_lifecycle_manager.hpp>
#include <hyper-cri/sandbox/sandbox_name_codec.hpp>
#include <hyper-cri/sandbox/sandbox_sorter.hpp>
#include <hyper-cri/sandbox/status_mapper.hpp>
#include <limits>
#include <sstream>

namespace hyper_cri {

namespace {

constexpr const char* kRunOperation = "RunPodSandbox";
constexpr const char* kStopOperation = "StopPodSandbox";
constexpr const char* kDeleteOperation = "RemovePodSandbox";
constexpr const char* kStatusOperation = "PodSandboxStatus";
constexpr const char* kListOperation = "ListPodSandbox";

std::string joinErrors(const std::vector<std::string>& errors)
{
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << errors[i];
    }
    return oss.str();
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string describeEngineCode(const EngineError& error)
{
    auto code = error.getEngineCode();
    return code ? std::to_string(*code) : "none";
}

} // namespace

int64_t toNanos(int64_t seconds)
{
    constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / kSecondToNano;
    constexpr int64_t kMinSeconds = std::numeric_limits<int64_t>::min() / kSecondToNano;
    if (seconds > kMaxSeconds || seconds < kMinSeconds) {
        throw EngineError("creation time " + std::to_string(seconds) + "s is out of range");
    }
    return seconds * kSecondToNano;
}

SandboxLifecycleManager::SandboxLifecycleManager(std::shared_ptr<EngineClient> client,
                                                 Logger* logger,
                                                 PodResource default_resource)
    : client_(std::move(client)), logger_(logger), default_resource_(default_resource)
{
    if (!client_) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "engine client is required");
    }
    if (!logger_) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "logger is required");
    }
}

PodSpec SandboxLifecycleManager::buildPodSpec(const SandboxConfig& config) const
{
    auto errors = config.validate();
    if (!errors.empty()) {
        throw SpecBuildError(joinErrors(errors));
    }

    PodSpec spec;
    spec.id = SandboxNameCodec::encode(config.metadata);
    spec.hostname = config.hostname;
    spec.labels = LabelAnnotationSplitter::merge(config.labels, config.annotations);
    spec.resource = default_resource_;

    for (const auto& mapping : config.port_mappings) {
        spec.port_mappings.push_back(
            PodPortMapping{toLower(mapping.protocol), mapping.container_port, mapping.host_port, mapping.host_ip});
    }

    if (config.dns_config) {
        spec.dns = config.dns_config->servers;
        spec.dns_search = config.dns_config->searches;
        spec.dns_options = config.dns_config->options;
    }

    return spec;
}

std::string SandboxLifecycleManager::runSandbox(const SandboxConfig& config)
{
    PodSpec spec;
    try {
        spec = buildPodSpec(config);
    }
    catch (SandboxError& e) {
        e.setContext(kRunOperation, config.metadata.name);
        logger_->error("Build pod spec for sandbox {} failed: {}", config.metadata.name, e.what());
        throw;
    }

    std::string pod_id;
    try {
        pod_id = client_->createPod(spec);
    }
    catch (SandboxError& e) {
        e.setContext(kRunOperation, spec.id);
        logger_->error("Create pod for sandbox {} failed: {}", spec.id, e.what());
        throw;
    }
    logger_->debug("Created pod {} for sandbox {}", pod_id, spec.id);

    try {
        client_->startPod(pod_id);
    }
    catch (SandboxError& e) {
        e.setContext(kRunOperation, pod_id);
        logger_->error("Start pod {} failed: {}", pod_id, e.what());
        removeAfterFailedStart(pod_id);
        throw;
    }
    catch (const std::exception& e) {
        logger_->error("Start pod {} failed: {}", pod_id, e.what());
        removeAfterFailedStart(pod_id);
        throw;
    }

    logger_->info("Sandbox {} running as pod {}", spec.id, pod_id);
    return pod_id;
}

void SandboxLifecycleManager::removeAfterFailedStart(const std::string& pod_id)
{
    try {
        client_->removePod(pod_id);
        logger_->info("Removed pod {} after failed start", pod_id);
    }
    catch (const std::exception& e) {
        logger_->warning("Remove pod {} failed: {}", pod_id, e.what());
    }
}

void SandboxLifecycleManager::stopSandbox(const std::string& sandbox_id)
{
    try {
        auto result = client_->stopPod(sandbox_id);
        logger_->debug("Stop pod {} returned code: {}, cause: {}", sandbox_id, result.code, result.cause);
    }
    catch (EngineError& e) {
        e.setContext(kStopOperation, sandbox_id);
        logger_->error("Stop pod {} failed, code: {}, cause: {}, error: {}", sandbox_id,
                       describeEngineCode(e), e.getCause(), e.what());
        throw;
    }
    catch (SandboxError& e) {
        e.setContext(kStopOperation, sandbox_id);
        logger_->error("Stop pod {} failed: {}", sandbox_id, e.what());
        throw;
    }
}

void SandboxLifecycleManager::deleteSandbox(const std::string& sandbox_id)
{
    try {
        client_->removePod(sandbox_id);
    }
    catch (SandboxError& e) {
        e.setContext(kDeleteOperation, sandbox_id);
        logger_->error("Remove pod {} failed: {}", sandbox_id, e.what());
        throw;
    }
    logger_->info("Removed pod {}", sandbox_id);
}

SandboxMetadata SandboxLifecycleManager::decodeName(const EngineRecord& record, const char* operation) const
{
    try {
        return SandboxNameCodec::decode(record.encoded_name);
    }
    catch (NameDecodeError& e) {
        e.setContext(operation, record.engine_id);
        logger_->error("Parse sandbox name for pod {} failed: {}", record.engine_id, e.what());
        throw;
    }
}

int64_t SandboxLifecycleManager::createdAtNanos(const EngineRecord& record, const char* operation) const
{
    try {
        return toNanos(record.created_at_seconds);
    }
    catch (EngineError& e) {
        e.setContext(operation, record.engine_id);
        logger_->error("Creation time of pod {} rejected: {}", record.engine_id, e.what());
        throw;
    }
}

SandboxStatus SandboxLifecycleManager::getSandboxStatus(const std::string& sandbox_id) const
{
    EngineRecord record;
    try {
        record = client_->getPodInfo(sandbox_id);
    }
    catch (SandboxError& e) {
        e.setContext(kStatusOperation, sandbox_id);
        logger_->error("GetPodInfo for {} failed: {}", sandbox_id, e.what());
        throw;
    }

    SandboxStatus status;
    status.id = sandbox_id;
    status.metadata = decodeName(record, kStatusOperation);
    status.state = StatusMapper::mapPhase(record.phase);
    if (!record.ip_addresses.empty()) {
        status.ip = record.ip_addresses.front();
    }
    status.created_at = createdAtNanos(record, kStatusOperation);

    auto split = LabelAnnotationSplitter::split(record.labels);
    status.labels = std::move(split.labels);
    status.annotations = std::move(split.annotations);

    return status;
}

std::vector<SandboxSummary> SandboxLifecycleManager::listSandboxes(const std::optional<SandboxFilter>& filter) const
{
    std::vector<EngineRecord> records;
    try {
        records = client_->getPodList();
    }
    catch (SandboxError& e) {
        e.setContext(kListOperation, "");
        logger_->error("GetPodList failed: {}", e.what());
        throw;
    }

    std::vector<SandboxSummary> items;
    items.reserve(records.size());
    for (const auto& record : records) {
        auto metadata = decodeName(record, kListOperation);

        if (filter && !matchesFilter(record, *filter)) {
            continue;
        }

        SandboxSummary summary;
        summary.id = record.engine_id;
        summary.metadata = std::move(metadata);
        summary.state = StatusMapper::mapPhase(record.phase);
        summary.created_at = createdAtNanos(record, kListOperation);
        summary.labels = LabelAnnotationSplitter::split(record.labels).labels;
        items.push_back(std::move(summary));
    }

    sortByCreatedAt(items);
    logger_->debug("Listed {} of {} pods", items.size(), records.size());
    return items;
}

} // namespace hyper_cri
