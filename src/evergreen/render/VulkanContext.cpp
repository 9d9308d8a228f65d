#include <evergreen/render/VulkanContext.hpp>
#include <evergreen/Logger.hpp>
#include <array>
#include <cstring>
#include <optional>
#include <vector>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace evergreen::render {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
	"VK_LAYER_KHRONOS_validation"
};

vk::Bool32 debug_callback(
	vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
	[[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
	const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
	[[maybe_unused]] void* user_data)
{
	auto& logger = Logger::instance();
	logger.set_pattern(fmt::format("[Evergreen]{:<32}[%^%5l%$] %v", "[Validation]"));
	switch (severity)
	{
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose:
			logger.trace("{}", callback_data->pMessage);
			break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo:
			logger.debug("{}", callback_data->pMessage);
			break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning:
			logger.warn("{}", callback_data->pMessage);
			break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError:
			logger.error("{}", callback_data->pMessage);
			break;
		default:
			logger.info("{}", callback_data->pMessage);
			break;
	}
	return vk::False;
}

bool validation_layers_available()
{
	auto layers_res = vk::enumerateInstanceLayerProperties();
	if (layers_res.result != vk::Result::eSuccess)
	{
		Logger::instance().warn("Could not enumerate instance layers: {}", to_string(layers_res.result));
		return false;
	}
	for (const char* wanted : VALIDATION_LAYERS)
	{
		bool found = false;
		for (const auto& layer : layers_res.value)
		{
			if (std::strcmp(wanted, layer.layerName) == 0)
			{
				found = true;
				break;
			}
		}
		if (!found)
		{
			Logger::instance().warn("Validation layer {} not available", wanted);
			return false;
		}
	}
	return true;
}

vk::DebugUtilsMessengerCreateInfoEXT debug_messenger_info()
{
	return vk::DebugUtilsMessengerCreateInfoEXT()
		.setMessageSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
		                    vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
		.setMessageType(vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
		                vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
		                vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
		.setPfnUserCallback(debug_callback);
}

std::expected<vk::Instance, std::string> create_instance(std::string_view title, bool validation)
{
	static vk::detail::DynamicLoader loader;
	if (!loader.success())
	{
		return std::unexpected("Vulkan loader library not found");
	}
	auto get_instance_proc = loader.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
	VULKAN_HPP_DEFAULT_DISPATCHER.init(get_instance_proc);

	std::string app_name{title};
	auto app_info = vk::ApplicationInfo()
		.setPApplicationName(app_name.c_str())
		.setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
		.setPEngineName("Evergreen")
		.setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
		.setApiVersion(VK_API_VERSION_1_3);

	uint32_t glfw_count = 0;
	const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_count);
	if (glfw_extensions == nullptr)
	{
		return std::unexpected("GLFW reports no Vulkan presentation support");
	}
	std::vector<const char*> extensions(glfw_extensions, glfw_extensions + glfw_count);
	if (validation)
	{
		extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
	}
	for (const auto* ext : extensions)
	{
		Logger::instance().debug("Instance extension {}", ext);
	}

	auto create_info = vk::InstanceCreateInfo()
		.setPApplicationInfo(&app_info)
		.setPEnabledExtensionNames(extensions);

	auto messenger_info = debug_messenger_info();
	if (validation)
	{
		create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
		create_info.setPNext(&messenger_info);
	}

	auto instance_res = vk::createInstance(create_info);
	CHECK_VK_RESULT(instance_res, "Failed to create instance: {}");
	VULKAN_HPP_DEFAULT_DISPATCHER.init(instance_res.value);
	return instance_res.value;
}

std::optional<uint32_t> graphics_family_of(vk::PhysicalDevice device)
{
	auto families = device.getQueueFamilyProperties();
	for (uint32_t i = 0; i < families.size(); i++)
	{
		if (families[i].queueFlags & vk::QueueFlagBits::eGraphics)
		{
			return i;
		}
	}
	return std::nullopt;
}

std::expected<vk::PhysicalDevice, std::string> select_physical_device(vk::Instance instance)
{
	auto devices_res = instance.enumeratePhysicalDevices();
	CHECK_VK_RESULT(devices_res, "Failed to enumerate physical devices: {}");

	// Discrete first, then integrated, then anything that can draw
	for (auto type : {vk::PhysicalDeviceType::eDiscreteGpu, vk::PhysicalDeviceType::eIntegratedGpu})
	{
		for (const auto& device : devices_res.value)
		{
			auto props = device.getProperties();
			if (props.deviceType == type && graphics_family_of(device))
			{
				Logger::instance().info("Selected {} GPU: {}", to_string(type), props.deviceName.data());
				return device;
			}
		}
	}
	for (const auto& device : devices_res.value)
	{
		if (graphics_family_of(device))
		{
			Logger::instance().warn("Falling back to GPU: {}", device.getProperties().deviceName.data());
			return device;
		}
	}
	return std::unexpected("No physical device with a graphics queue");
}

std::expected<vk::Device, std::string> create_logical_device(vk::PhysicalDevice physical_device, uint32_t family)
{
	float priority = 1.0f;
	auto queue_info = vk::DeviceQueueCreateInfo()
		.setQueueFamilyIndex(family)
		.setQueueCount(1)
		.setPQueuePriorities(&priority);

	std::array extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

	// Instance offsets come from push constants, but SV_InstanceID still
	// needs draw parameters on some drivers
	vk::PhysicalDeviceVulkan11Features vulkan11_features{};
	vulkan11_features.shaderDrawParameters = VK_TRUE;

	vk::PhysicalDeviceFeatures2 features2{};
	features2.pNext = &vulkan11_features;

	auto create_info = vk::DeviceCreateInfo()
		.setQueueCreateInfos(queue_info)
		.setPEnabledExtensionNames(extensions)
		.setPNext(&features2);

	auto device_res = physical_device.createDevice(create_info);
	CHECK_VK_RESULT(device_res, "Failed to create logical device: {}");
	return device_res.value;
}

} // namespace

std::expected<std::unique_ptr<VulkanContext>, std::string> VulkanContext::create(std::string_view title)
{
	std::unique_ptr<VulkanContext> context{new VulkanContext()};

	const bool validation = ENABLE_VALIDATION && validation_layers_available();
	auto instance = create_instance(title, validation);
	if (!instance) return std::unexpected(instance.error());
	context->m_instance = *instance;

	if (validation)
	{
		auto messenger_res = context->m_instance.createDebugUtilsMessengerEXT(debug_messenger_info());
		CHECK_VK_RESULT(messenger_res, "Failed to create debug messenger: {}");
		context->m_debug_messenger = messenger_res.value;
		Logger::instance().info("Validation layers enabled");
	}

	auto physical = select_physical_device(context->m_instance);
	if (!physical) return std::unexpected(physical.error());
	context->m_physical_device = *physical;
	context->m_graphics_family = *graphics_family_of(*physical);

	auto device = create_logical_device(context->m_physical_device, context->m_graphics_family);
	if (!device) return std::unexpected(device.error());
	context->m_device = *device;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(context->m_device);
	context->m_graphics_queue = context->m_device.getQueue(context->m_graphics_family, 0);

	Logger::instance().info("Vulkan ready (header {}, graphics family {})", VK_HEADER_VERSION,
	                        context->m_graphics_family);
	return context;
}

VulkanContext::~VulkanContext()
{
	if (m_device)
	{
		m_device.destroy();
		Logger::instance().trace("Destroyed logical device");
	}
	if (m_debug_messenger)
	{
		m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
	}
	if (m_instance)
	{
		m_instance.destroy();
		Logger::instance().trace("Destroyed instance");
	}
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(uint32_t type_bits,
                                                                     vk::MemoryPropertyFlags properties) const
{
	auto memory = m_physical_device.getMemoryProperties();
	for (uint32_t i = 0; i < memory.memoryTypeCount; i++)
	{
		if ((type_bits & (1u << i)) && (memory.memoryTypes[i].propertyFlags & properties) == properties)
		{
			return i;
		}
	}
	return std::unexpected("No suitable memory type");
}

} // namespace evergreen::render
